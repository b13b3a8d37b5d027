#include "Palette.h"

namespace Codex::Render {

Palette Palette::builtIn() {
    Palette p;
    p.colors_ = {
        {"r", {166, 74, 46}},   {"R", {215, 66, 0}},    {"o", {241, 95, 34}},   {"O", {233, 159, 16}},
        {"w", {152, 135, 95}},  {"W", {207, 192, 65}},  {"g", {0, 148, 3}},     {"G", {0, 196, 32}},
        {"b", {0, 72, 189}},    {"B", {0, 150, 255}},   {"c", {64, 164, 185}},  {"C", {119, 191, 207}},
        {"m", {177, 84, 207}},  {"M", {218, 91, 214}},  {"k", {15, 59, 58}},    {"K", {21, 83, 82}},
        {"y", {177, 201, 195}}, {"Y", {255, 255, 255}}, {"transparent", {15, 64, 63, 0}},
    };
    return p;
}

void Palette::set(const std::string& code, Color color) {
    colors_[std::string(normalizeColorCode(code))] = color;
}

std::optional<Color> Palette::find(std::string_view code) const {
    auto it = colors_.find(std::string(normalizeColorCode(code)));
    if (it == colors_.end()) return std::nullopt;
    return it->second;
}

Color Palette::resolve(std::string_view code,
                       Color fallback,
                       DiagnosticLog* diagnostics,
                       const std::string& blueprint) const {
    if (auto c = find(code)) return *c;
    if (diagnostics) {
        diagnostics->add(Diagnostic{DiagnosticKind::UnknownColorCode, blueprint, std::string(code),
                                    "unknown color code '" + std::string(code) + "'"});
    }
    return fallback;
}

std::string_view normalizeColorCode(std::string_view code) {
    while (!code.empty() && (code.front() == '&' || code.front() == '^' || code.front() == ' ')) {
        code.remove_prefix(1);
    }
    while (!code.empty() && code.back() == ' ') code.remove_suffix(1);
    return code;
}

}  // namespace Codex::Render
