// Color code -> RGBA lookup: the built-in Qud palette plus configured overrides.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "../core/Diagnostics.h"
#include "Color.h"

namespace Codex::Render {

class Palette {
public:
    // The sixteen one-letter codes plus "transparent".
    static Palette builtIn();

    void set(const std::string& code, Color color);
    // Accepts "&Y", "^k" or "Y"; the markup prefix is ignored.
    std::optional<Color> find(std::string_view code) const;
    // Unknown codes fall back and are reported as UnknownColorCode when a log is given.
    Color resolve(std::string_view code,
                  Color fallback,
                  DiagnosticLog* diagnostics = nullptr,
                  const std::string& blueprint = {}) const;
    std::size_t size() const { return colors_.size(); }

private:
    std::unordered_map<std::string, Color> colors_;
};

// Strips the '&' / '^' markup prefix from a color code.
std::string_view normalizeColorCode(std::string_view code);

}  // namespace Codex::Render
