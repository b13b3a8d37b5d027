// Character-level repair of blueprint markup before it reaches the XML parser.
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "../core/Diagnostics.h"

namespace Codex::Markup {

struct RepairReport {
    std::string markup;
    int charactersReplaced{0};   // control bytes, DEL, NUL, invalid UTF-8 and illegal character references
    int lineBreaksRepaired{0};   // CRLF/CR normalized plus breaks escaped inside attribute values
    int entitiesEscaped{0};      // stray '&' and '<' inside attribute values

    int total() const { return charactersReplaced + lineBreaksRepaired + entitiesEscaped; }
};

// Individual passes, exposed for testing. Each returns the number of repairs made.
int replaceIllegalCharacters(std::string& text);
int normalizeLineBreaks(std::string& text);

// Runs every pass in order. Fails with MalformedSource when a tag, attribute value, comment
// or other markup construct is left open at end of input.
std::optional<RepairReport> repairMarkup(std::string_view raw, const std::string& sourceName, LoadError& error);

}  // namespace Codex::Markup
