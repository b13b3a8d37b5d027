#include "DiceBag.h"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace Qud::Catalog {

static bool isOp(char c) { return c == '+' || c == '-'; }

static std::optional<long> parseNumber(std::string_view s) {
    if (s.empty() || s.size() > 9) return std::nullopt;
    long v = 0;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        v = v * 10 + (c - '0');
    }
    return v;
}

static std::optional<DiceBag> fail(std::string* error, std::string message) {
    if (error) *error = std::move(message);
    return std::nullopt;
}

std::optional<DiceBag> DiceBag::parse(std::string_view text, std::string* error) {
    std::string s;
    s.reserve(text.size());
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != 'd' && !isOp(c)) {
            return fail(error, "invalid dice string '" + std::string(text) + "': only digits, d, + and - are allowed");
        }
        s.push_back(c);
    }
    if (s.empty()) return fail(error, "empty dice string");
    for (std::size_t i = 0; i + 1 < s.size(); ++i) {
        // "+-" reads as subtraction; any other run of operators is rejected.
        if ((s[i] == '+' && s[i + 1] == '+') || (s[i] == '-' && isOp(s[i + 1]))) {
            return fail(error, "invalid dice string '" + s + "': operators cannot repeat");
        }
    }

    DiceBag bag;
    bag.text_ = s;
    std::size_t i = 0;
    while (i < s.size()) {
        int sign = 1;
        if (isOp(s[i])) {
            if (s[i] == '+' && i + 1 < s.size() && s[i + 1] == '-') ++i;
            sign = s[i] == '-' ? -1 : 1;
            ++i;
        }
        std::size_t end = i;
        while (end < s.size() && !isOp(s[end])) ++end;
        const std::string_view segment(s.data() + i, end - i);
        if (segment.empty()) return fail(error, "invalid dice string '" + s + "': dangling operator");

        const std::size_t d = segment.find('d');
        std::optional<long> quantity;
        std::optional<long> sides = 1L;
        if (d == std::string_view::npos) {
            quantity = parseNumber(segment);
        } else {
            quantity = parseNumber(segment.substr(0, d));
            sides = parseNumber(segment.substr(d + 1));
        }
        if (!quantity || !sides) {
            return fail(error, std::string(segment) + " must be in format (number) or (number)d(number)");
        }
        if (*quantity > kMaxQuantity) return fail(error, std::to_string(*quantity) + " is too many dice to roll");
        if (*sides < 1) return fail(error, std::to_string(*sides) + " is too low for the number of sides on a die");
        if (*sides > kMaxSides) return fail(error, std::to_string(*sides) + " is too high for the number of sides on a die");
        bag.dice_.push_back(Die{sign * static_cast<int>(*quantity), static_cast<int>(*sides)});
        i = end;
    }
    const long long low = bag.total(false);
    const long long high = bag.total(true);
    if (low < std::numeric_limits<int>::min() || high > std::numeric_limits<int>::max()) {
        return fail(error, "invalid dice string '" + s + "': totals are out of range");
    }
    return bag;
}

long long DiceBag::total(bool highest) const {
    long long val = 0;
    for (const auto& die : dice_) {
        const long long q = die.quantity;
        val += (q >= 0) == highest ? q * die.sides : q;
    }
    return val;
}

double DiceBag::average() const {
    double val = 0.0;
    for (const auto& die : dice_) val += die.quantity * (1.0 + die.sides) / 2.0;
    return val;
}

int DiceBag::minimum() const { return static_cast<int>(total(false)); }

int DiceBag::maximum() const { return static_cast<int>(total(true)); }

}  // namespace Qud::Catalog
