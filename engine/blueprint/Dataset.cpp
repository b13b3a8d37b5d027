#include "Dataset.h"

#include <chrono>

#include "../core/Logger.h"
#include "../markup/MarkupRepair.h"
#include "BlueprintLoader.h"

namespace Codex::Blueprints {

std::optional<Dataset> loadDataset(const std::vector<SourceFile>& sources,
                                   const std::string& version,
                                   LoadError& error) {
    const auto start = std::chrono::steady_clock::now();
    RepairTotals totals{};
    std::vector<BlueprintRecord> records;

    for (const auto& source : sources) {
        auto repaired = Markup::repairMarkup(source.contents, source.name, error);
        if (!repaired) {
            return std::nullopt;
        }
        totals.charactersReplaced += repaired->charactersReplaced;
        totals.lineBreaksRepaired += repaired->lineBreaksRepaired;
        totals.entitiesEscaped += repaired->entitiesEscaped;

        auto parsed = BlueprintLoader::parse(repaired->markup, source.name, error);
        if (!parsed) {
            return std::nullopt;
        }
        if (!BlueprintLoader::append(records, std::move(*parsed), error)) {
            return std::nullopt;
        }
    }

    auto tree = BlueprintTree::build(std::move(records), error);
    if (!tree) {
        return std::nullopt;
    }

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
    logInfo("Loaded dataset " + (version.empty() ? std::string("(unversioned)") : version) + ": " +
            std::to_string(tree->size()) + " blueprints from " + std::to_string(sources.size()) + " sources in " +
            std::to_string(elapsed) + " ms");
    return Dataset{std::move(*tree), version, totals};
}

}  // namespace Codex::Blueprints
