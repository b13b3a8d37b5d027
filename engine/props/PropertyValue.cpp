#include "PropertyValue.h"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace Codex::Props {

namespace {
std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}
}  // namespace

std::string_view toLabel(ValueType type) {
    switch (type) {
        case ValueType::Bool:
            return "bool";
        case ValueType::Int:
            return "int";
        case ValueType::Decimal:
            return "decimal";
        case ValueType::Text:
            return "text";
        case ValueType::List:
            return "list";
        case ValueType::NamedList:
        default:
            return "named-list";
    }
}

ValueType typeOf(const PropertyValue& value) {
    return static_cast<ValueType>(value.index());
}

std::string formatValue(const PropertyValue& value) {
    struct Formatter {
        std::string operator()(bool v) const { return v ? "true" : "false"; }
        std::string operator()(int v) const { return std::to_string(v); }
        std::string operator()(double v) const {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        }
        std::string operator()(const std::string& v) const { return v; }
        std::string operator()(const StringList& v) const {
            std::string out;
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += v[i];
            }
            return out;
        }
        std::string operator()(const NamedValueList& v) const {
            std::string out;
            for (std::size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ", ";
                out += v[i].first + ":" + std::to_string(v[i].second);
            }
            return out;
        }
    };
    return std::visit(Formatter{}, value);
}

std::optional<int> parseInt(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<double> parseDecimal(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    // strtod needs a terminated buffer.
    const std::string buf(text);
    char* end = nullptr;
    const double value = std::strtod(buf.c_str(), &end);
    if (end != buf.c_str() + buf.size()) return std::nullopt;
    return value;
}

std::optional<bool> parseBool(std::string_view text) {
    const std::string v = lower(trim(text));
    if (v == "true" || v == "1" || v == "yes") return true;
    if (v == "false" || v == "0" || v == "no") return false;
    return std::nullopt;
}

StringList splitList(std::string_view text, char sep) {
    StringList out;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(sep, start);
        if (end == std::string_view::npos) end = text.size();
        auto item = trim(text.substr(start, end - start));
        if (!item.empty()) out.emplace_back(item);
        start = end + 1;
    }
    return out;
}

}  // namespace Codex::Props
