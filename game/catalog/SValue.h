// Level-scaled stat expressions such as "16,1d3,(t-1)d2" where t is the tier.
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Qud::Catalog {

class SValue {
public:
    // Each comma-separated part is a dice string once every "(expr)" over t is evaluated.
    static std::optional<SValue> parse(std::string_view text, int level = 1, std::string* error = nullptr);

    static int tierForLevel(int level) { return level / 5 + 1; }

    double average() const { return average_; }
    // All parts joined into one dice string, e.g. "16+1d3+1d2".
    const std::string& diceString() const { return dice_; }
    const std::string& text() const { return text_; }

private:
    double average_{0.0};
    std::string dice_;
    std::string text_;
};

// "18-29" style levels use the lower bound.
std::optional<int> parseLevel(std::string_view text);

}  // namespace Qud::Catalog
