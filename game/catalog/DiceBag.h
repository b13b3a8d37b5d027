// Dice strings such as "1d4", "3d6+1-2d2" or "17", with their roll statistics.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Qud::Catalog {

class DiceBag {
public:
    struct Die {
        int quantity{0};  // negative for subtracted dice
        int sides{1};     // plain numbers are stored as Nd1
    };

    static constexpr int kMaxQuantity = 5000;
    static constexpr int kMaxSides = 500;

    // Whitespace is ignored. Strings whose totals do not fit an int are rejected.
    // On failure, error (if given) says why.
    static std::optional<DiceBag> parse(std::string_view text, std::string* error = nullptr);

    double average() const;
    int minimum() const;
    int maximum() const;

    const std::vector<Die>& dice() const { return dice_; }
    const std::string& text() const { return text_; }

private:
    long long total(bool highest) const;

    std::vector<Die> dice_;
    std::string text_;
};

}  // namespace Qud::Catalog
