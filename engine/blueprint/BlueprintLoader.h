// Parses repaired markup into blueprint records using libxml2.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/Diagnostics.h"
#include "BlueprintRecord.h"

namespace Codex::Blueprints {

class BlueprintLoader {
public:
    // Parses every <object> under the document root. Fails with MalformedSource when libxml2
    // rejects the markup or an object has no Name, and with DuplicateBlueprint when a Name
    // repeats inside this source. Each record's rawSource is its element's bytes in markup.
    static std::optional<std::vector<BlueprintRecord>> parse(const std::string& markup,
                                                             const std::string& sourceName,
                                                             LoadError& error);

    // Appends incoming to records, failing with DuplicateBlueprint on an id already present.
    static bool append(std::vector<BlueprintRecord>& records,
                       std::vector<BlueprintRecord>&& incoming,
                       LoadError& error);
};

}  // namespace Codex::Blueprints
