#include "SValue.h"

#include <cctype>
#include <limits>

#include "DiceBag.h"

namespace Qud::Catalog {

// Evaluates "t", "t-1", "t+2", "3" ... (integers, t, + and - only).
static std::optional<int> evalTierExpr(std::string_view expr, int tier) {
    int total = 0;
    int sign = 1;
    bool expectOperand = true;
    std::size_t i = 0;
    while (i < expr.size()) {
        const char c = expr[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if (expectOperand && (c == 't' || c == 'T')) {
            total += sign * tier;
            expectOperand = false;
            ++i;
        } else if (expectOperand && std::isdigit(static_cast<unsigned char>(c))) {
            int v = 0;
            while (i < expr.size() && std::isdigit(static_cast<unsigned char>(expr[i]))) {
                v = v * 10 + (expr[i] - '0');
                if (v > 1000000) return std::nullopt;
                ++i;
            }
            total += sign * v;
            expectOperand = false;
        } else if (!expectOperand && (c == '+' || c == '-')) {
            sign = c == '-' ? -1 : 1;
            expectOperand = true;
            ++i;
        } else {
            return std::nullopt;
        }
    }
    if (expectOperand) return std::nullopt;
    return total;
}

static std::optional<std::string> expandPart(std::string_view part, int tier, std::string* error) {
    std::string out;
    std::size_t i = 0;
    while (i < part.size()) {
        if (part[i] != '(') {
            out.push_back(part[i++]);
            continue;
        }
        const std::size_t close = part.find(')', i);
        if (close == std::string_view::npos) {
            if (error) *error = "unbalanced parenthesis in '" + std::string(part) + "'";
            return std::nullopt;
        }
        auto value = evalTierExpr(part.substr(i + 1, close - i - 1), tier);
        if (!value) {
            if (error) *error = "cannot evaluate '" + std::string(part.substr(i, close - i + 1)) + "'";
            return std::nullopt;
        }
        out += std::to_string(*value);
        i = close + 1;
    }
    return out;
}

std::optional<SValue> SValue::parse(std::string_view text, int level, std::string* error) {
    const int tier = tierForLevel(level);
    SValue sv;
    sv.text_ = std::string(text);
    std::size_t start = 0;
    bool any = false;
    long long low = 0;
    long long high = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(',', start);
        if (end == std::string_view::npos) end = text.size();
        const std::string_view part = text.substr(start, end - start);
        start = end + 1;
        if (part.find_first_not_of(" \t") == std::string_view::npos) continue;

        auto expanded = expandPart(part, tier, error);
        if (!expanded) return std::nullopt;
        auto dice = DiceBag::parse(*expanded, error);
        if (!dice) return std::nullopt;
        low += dice->minimum();
        high += dice->maximum();
        sv.average_ += dice->average();
        if (any && !dice->text().empty() && dice->text().front() != '-') sv.dice_ += '+';
        sv.dice_ += dice->text();
        any = true;
    }
    if (!any) {
        if (error) *error = "empty sValue";
        return std::nullopt;
    }
    // The joined dice string must still total within an int.
    if (low < std::numeric_limits<int>::min() || high > std::numeric_limits<int>::max()) {
        if (error) *error = "sValue '" + sv.text_ + "' is out of range";
        return std::nullopt;
    }
    return sv;
}

std::optional<int> parseLevel(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
    bool negative = false;
    if (i < text.size() && text[i] == '-') {
        negative = true;
        ++i;
    }
    if (i >= text.size() || !std::isdigit(static_cast<unsigned char>(text[i]))) return std::nullopt;
    int v = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
        v = v * 10 + (text[i] - '0');
        if (v > 1000000) return std::nullopt;
        ++i;
    }
    // Anything after the number must be a "-upper" range bound.
    if (i < text.size() && text[i] != '-') return std::nullopt;
    return negative ? -v : v;
}

}  // namespace Qud::Catalog
