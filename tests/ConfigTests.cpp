// JSON configuration loading with built-in defaults.
#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>

#include "../engine/core/Config.h"
#include "../engine/core/Logger.h"

using namespace Codex;

int main() {
    int warnings = 0;
    Logger::setSink([&](LogLevel level, std::string_view) {
        if (level == LogLevel::Warning) ++warnings;
    });

    {
        const CodexConfig cfg = defaultConfig();
        assert(cfg.logLevel == LogLevel::Info);
        assert(cfg.tileWidth == 16 && cfg.tileHeight == 24);
        assert(cfg.bigTileScale == 10);
        assert(cfg.defaultGender == "neuter");
        assert(cfg.findGender("female")->subjective == "she");
        assert(cfg.findGender("plural")->plural);
        assert(!cfg.findGender("robot"));
    }
    {
        auto cfg = ConfigLoader::loadFromString(R"({
            "logLevel": "debug",
            "textureRoot": "/opt/qud/Textures",
            "defaultGender": "robot",
            "genders": {
                "robot": {"Subjective": "it", "Objective": "it", "PossessiveAdjective": "its",
                          "SubstantivePossessive": "its", "Reflexive": "itself"},
                "male": {"Reflexive": "hisself"}
            },
            "palette": {"Y": [250, 250, 250], "&q": [1, 2, 3, 4], "bad": [1, 2]},
            "bigTileScale": 4
        })");
        assert(cfg);
        assert(cfg->logLevel == LogLevel::Debug);
        assert(cfg->textureRoot == "/opt/qud/Textures");
        assert(cfg->findGender("robot")->possessiveAdjective == "its");
        assert(cfg->findGender(cfg->defaultGender));
        // Partial entries override only what they name.
        assert(cfg->findGender("male")->reflexive == "hisself");
        assert(cfg->findGender("male")->subjective == "he");
        assert(cfg->palette.size() == 2);
        assert(cfg->palette.at("Y").r == 250);
        assert(cfg->palette.at("&q").a == 4);
        assert(cfg->bigTileScale == 4);
        assert(cfg->tileWidth == 16);
        assert(warnings == 1);
    }
    {
        warnings = 0;
        assert(!ConfigLoader::loadFromString("{ not json"));
        assert(!ConfigLoader::loadFromString("[1, 2]"));
        assert(!ConfigLoader::loadFromString(R"({"tileWidth": "wide"})"));
        assert(!ConfigLoader::loadFromFile("/nonexistent/codex.json"));
        assert(warnings >= 3);
    }
    {
        const std::string path = "codex_config_test.json";
        {
            std::ofstream out(path);
            out << R"({"logLevel": "warn", "tileHeight": 32})";
        }
        auto cfg = ConfigLoader::loadFromFile(path);
        std::remove(path.c_str());
        assert(cfg);
        assert(cfg->logLevel == LogLevel::Warning);
        assert(cfg->tileHeight == 32);
        assert(cfg->genders.size() == 4);
    }
    return 0;
}
