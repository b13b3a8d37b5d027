// Code Page 437 glyph mapping for control bytes the game stores raw in its markup.
#pragma once

#include <cstdint>
#include <string>

namespace Codex::Markup {

// Unicode code point of the CP437 glyph for a byte value (0x00-0xFF).
char32_t cp437ToUnicode(std::uint8_t value);

void appendUtf8(std::string& out, char32_t codepoint);

}  // namespace Codex::Markup
