// Data-driven settings for loading, text substitution and tile rendering.
#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../render/Color.h"
#include "Logger.h"

namespace Codex {

// Grammatical forms used to fill pronoun and verb placeholders.
struct GenderDef {
    std::string name;
    std::string subjective;
    std::string objective;
    std::string possessiveAdjective;
    std::string substantivePossessive;
    std::string reflexive;
    bool plural{false};  // verbs conjugate in the plural ("they are")
};

struct CodexConfig {
    LogLevel logLevel{LogLevel::Info};
    std::string textureRoot{"Textures"};
    std::string defaultGender{"neuter"};
    std::vector<GenderDef> genders;
    // Overrides merged over the built-in palette, keyed by color code.
    std::unordered_map<std::string, Render::Color> palette;
    int tileWidth{16};
    int tileHeight{24};
    int bigTileScale{10};

    const GenderDef* findGender(const std::string& name) const;
};

// Built-in male/female/neuter/plural gender table.
std::vector<GenderDef> defaultGenders();
CodexConfig defaultConfig();

class ConfigLoader {
public:
    // Missing keys keep their defaults; unreadable or unparsable input returns nullopt.
    static std::optional<CodexConfig> loadFromFile(const std::string& path);
    static std::optional<CodexConfig> loadFromString(const std::string& text);
};

}  // namespace Codex
