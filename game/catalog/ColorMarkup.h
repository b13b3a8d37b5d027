// Helpers for Qud color markup in display names and ColorString attributes.
#pragma once

#include <string>
#include <string_view>

namespace Qud::Catalog {

// Removes "&X" foreground and "^X" background codes; "&&" and "^^" become literal characters.
std::string stripOldStyleColors(std::string_view text);
// Replaces "{{shader|text}}" with text, innermost first.
std::string stripNewStyleColors(std::string_view text);
std::string stripColors(std::string_view text);

// "&Y^k" -> "Y" and "k". Empty when the part is not present.
std::string foregroundCode(std::string_view colorString);
std::string backgroundCode(std::string_view colorString);

}  // namespace Qud::Catalog
