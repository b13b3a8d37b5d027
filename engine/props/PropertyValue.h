// Typed values produced by property resolution and the raw-string conversions behind them.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace Codex::Props {

using StringList = std::vector<std::string>;
using NamedValueList = std::vector<std::pair<std::string, int>>;

using PropertyValue = std::variant<bool, int, double, std::string, StringList, NamedValueList>;

enum class ValueType { Bool, Int, Decimal, Text, List, NamedList };

std::string_view toLabel(ValueType type);
ValueType typeOf(const PropertyValue& value);

// Human-readable rendering: lists comma-joined, named values as "name:value".
std::string formatValue(const PropertyValue& value);

// Strict conversions: surrounding whitespace is allowed, trailing garbage is not.
std::optional<int> parseInt(std::string_view text);
std::optional<double> parseDecimal(std::string_view text);
// Accepts true/false in any case, plus 1/0 and yes/no.
std::optional<bool> parseBool(std::string_view text);

// Splits on sep, trimming whitespace and dropping empty items.
StringList splitList(std::string_view text, char sep = ',');

}  // namespace Codex::Props
