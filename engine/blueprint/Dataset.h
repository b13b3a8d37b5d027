// One-shot load of every blueprint source into an immutable inheritance tree.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/Diagnostics.h"
#include "BlueprintTree.h"

namespace Codex::Blueprints {

struct SourceFile {
    std::string name;
    std::string contents;
};

struct RepairTotals {
    int charactersReplaced{0};
    int lineBreaksRepaired{0};
    int entitiesEscaped{0};
};

struct Dataset {
    BlueprintTree tree;
    std::string version;
    RepairTotals repairs;
};

// Repair, parse and link all sources. Any fatal error aborts the whole load and fills error.
std::optional<Dataset> loadDataset(const std::vector<SourceFile>& sources,
                                   const std::string& version,
                                   LoadError& error);

}  // namespace Codex::Blueprints
