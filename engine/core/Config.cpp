#include "Config.h"

#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

namespace Codex {

namespace {
std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (j.contains(key) && j[key].is_string()) return j[key].get<std::string>();
    return fallback;
}

std::optional<Render::Color> readColor(const nlohmann::json& arr) {
    if (!arr.is_array() || arr.size() < 3 || arr.size() > 4) return std::nullopt;
    int channels[4] = {0, 0, 0, 255};
    for (std::size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_number_integer()) return std::nullopt;
        channels[i] = std::clamp(arr[i].get<int>(), 0, 255);
    }
    Render::Color c{};
    c.r = static_cast<unsigned char>(channels[0]);
    c.g = static_cast<unsigned char>(channels[1]);
    c.b = static_cast<unsigned char>(channels[2]);
    c.a = static_cast<unsigned char>(channels[3]);
    return c;
}

void readGenders(const nlohmann::json& src, std::vector<GenderDef>& dst) {
    for (const auto& kv : src.items()) {
        if (!kv.value().is_object()) continue;
        const auto& g = kv.value();
        auto it = std::find_if(dst.begin(), dst.end(), [&](const GenderDef& d) { return d.name == kv.key(); });
        GenderDef def = it != dst.end() ? *it : GenderDef{};
        def.name = kv.key();
        def.subjective = readString(g, "Subjective", def.subjective);
        def.objective = readString(g, "Objective", def.objective);
        def.possessiveAdjective = readString(g, "PossessiveAdjective", def.possessiveAdjective);
        def.substantivePossessive = readString(g, "SubstantivePossessive", def.substantivePossessive);
        def.reflexive = readString(g, "Reflexive", def.reflexive);
        def.plural = g.value("Plural", def.plural);
        if (it != dst.end()) {
            *it = def;
        } else {
            dst.push_back(def);
        }
    }
}

std::optional<CodexConfig> fromJson(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    CodexConfig cfg = defaultConfig();
    if (j.contains("logLevel") && j["logLevel"].is_string()) {
        auto level = parseLogLevel(j["logLevel"].get<std::string>());
        if (level) {
            cfg.logLevel = *level;
        } else {
            logWarn("ConfigLoader: unknown logLevel " + j["logLevel"].get<std::string>());
        }
    }
    cfg.textureRoot = readString(j, "textureRoot", cfg.textureRoot);
    cfg.defaultGender = readString(j, "defaultGender", cfg.defaultGender);
    if (j.contains("genders") && j["genders"].is_object()) {
        readGenders(j["genders"], cfg.genders);
    }
    if (j.contains("palette") && j["palette"].is_object()) {
        for (const auto& kv : j["palette"].items()) {
            auto color = readColor(kv.value());
            if (!color) {
                logWarn("ConfigLoader: ignoring malformed palette entry " + kv.key());
                continue;
            }
            cfg.palette[kv.key()] = *color;
        }
    }
    cfg.tileWidth = std::max(1, j.value("tileWidth", cfg.tileWidth));
    cfg.tileHeight = std::max(1, j.value("tileHeight", cfg.tileHeight));
    cfg.bigTileScale = std::max(1, j.value("bigTileScale", cfg.bigTileScale));
    if (!cfg.findGender(cfg.defaultGender)) {
        logWarn("ConfigLoader: defaultGender " + cfg.defaultGender + " is not in the gender table");
    }
    return cfg;
}
}  // namespace

const GenderDef* CodexConfig::findGender(const std::string& name) const {
    for (const auto& g : genders) {
        if (g.name == name) return &g;
    }
    return nullptr;
}

std::vector<GenderDef> defaultGenders() {
    return {
        {"male", "he", "him", "his", "his", "himself", false},
        {"female", "she", "her", "her", "hers", "herself", false},
        {"neuter", "it", "it", "its", "its", "itself", false},
        {"plural", "they", "them", "their", "theirs", "themselves", true},
    };
}

CodexConfig defaultConfig() {
    CodexConfig cfg{};
    cfg.genders = defaultGenders();
    return cfg;
}

std::optional<CodexConfig> ConfigLoader::loadFromFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        logWarn("ConfigLoader: cannot open " + path);
        return std::nullopt;
    }
    // value() throws on mistyped keys, so conversion stays inside the try as well.
    try {
        nlohmann::json j;
        in >> j;
        return fromJson(j);
    } catch (const nlohmann::json::exception& e) {
        logWarn("ConfigLoader: failed to parse " + path + " | " + e.what());
        return std::nullopt;
    }
}

std::optional<CodexConfig> ConfigLoader::loadFromString(const std::string& text) {
    try {
        return fromJson(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        logWarn(std::string("ConfigLoader: failed to parse config text | ") + e.what());
        return std::nullopt;
    }
}

}  // namespace Codex
