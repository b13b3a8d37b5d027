#include "ColorMarkup.h"

namespace Qud::Catalog {

std::string stripOldStyleColors(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if ((c == '&' || c == '^') && i + 1 < text.size()) {
            if (text[i + 1] == c) out.push_back(c);
            ++i;
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string stripNewStyleColors(std::string_view text) {
    std::string out(text);
    for (;;) {
        const std::size_t close = out.find("}}");
        if (close == std::string::npos) break;
        const std::size_t open = out.rfind("{{", close);
        if (open == std::string::npos) break;
        const std::string body = out.substr(open + 2, close - open - 2);
        const std::size_t bar = body.find('|');
        // "{{Y|text}}" keeps text; "{{text}}" without a shader keeps it whole.
        const std::string inner = bar == std::string::npos ? body : body.substr(bar + 1);
        out.replace(open, close - open + 2, inner);
    }
    return out;
}

std::string stripColors(std::string_view text) {
    return stripNewStyleColors(stripOldStyleColors(text));
}

std::string foregroundCode(std::string_view colorString) {
    const std::size_t caret = colorString.find('^');
    std::string_view fg = colorString.substr(0, caret);
    const std::size_t amp = fg.rfind('&');
    if (amp != std::string_view::npos) return std::string(fg.substr(amp + 1, 1));
    return std::string(fg);
}

std::string backgroundCode(std::string_view colorString) {
    const std::size_t caret = colorString.find('^');
    if (caret == std::string_view::npos || caret + 1 >= colorString.size()) return {};
    return std::string(colorString.substr(caret + 1, 1));
}

}  // namespace Qud::Catalog
