#include "MarkupRepair.h"

#include <cctype>
#include <chrono>
#include <functional>

#include "../core/Logger.h"
#include "Cp437.h"

namespace Codex::Markup {

namespace {
constexpr char32_t kReplacementChar = 0xFFFD;

// Length of a well-formed UTF-8 sequence starting at i, or 0 if the bytes are invalid.
std::size_t utf8SequenceLength(std::string_view s, std::size_t i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        if ((b & 0xC0) != 0x80) return 0;
    }
    const auto b1 = static_cast<unsigned char>(s[i + 1]);
    if (b0 == 0xE0 && b1 < 0xA0) return 0;   // overlong
    if (b0 == 0xED && b1 >= 0xA0) return 0;  // surrogate half
    if (b0 == 0xF0 && b1 < 0x90) return 0;   // overlong
    if (b0 == 0xF4 && b1 >= 0x90) return 0;  // beyond U+10FFFF
    // U+FFFE and U+FFFF are not XML characters either.
    if (b0 == 0xEF && b1 == 0xBF) {
        const auto b2 = static_cast<unsigned char>(s[i + 2]);
        if (b2 == 0xBE || b2 == 0xBF) return 0;
    }
    return len;
}

bool startsWith(std::string_view s, std::size_t pos, std::string_view prefix) {
    return s.compare(pos, prefix.size(), prefix) == 0;
}

// True when text[pos] == '&' begins a reference the parser accepts without a DTD.
bool isValidReference(std::string_view text, std::size_t pos) {
    std::size_t semi = text.find(';', pos + 1);
    if (semi == std::string_view::npos || semi - pos > 12) return false;
    std::string_view body = text.substr(pos + 1, semi - pos - 1);
    if (body.empty()) return false;
    if (body[0] == '#') {
        if (body.size() < 2) return false;
        if (body[1] == 'x' || body[1] == 'X') {
            if (body.size() < 3) return false;
            for (std::size_t i = 2; i < body.size(); ++i) {
                if (!std::isxdigit(static_cast<unsigned char>(body[i]))) return false;
            }
            return true;
        }
        for (std::size_t i = 1; i < body.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(body[i]))) return false;
        }
        return true;
    }
    return body == "amp" || body == "lt" || body == "gt" || body == "quot" || body == "apos";
}

// Code point of the numeric reference "&#N;" or "&#xN;" starting at text[pos].
char32_t numericReference(std::string_view text, std::size_t pos) {
    const std::size_t semi = text.find(';', pos + 1);
    std::string_view digits = text.substr(pos + 2, semi - pos - 2);
    int base = 10;
    if (!digits.empty() && (digits[0] == 'x' || digits[0] == 'X')) {
        base = 16;
        digits.remove_prefix(1);
    }
    unsigned long long value = 0;
    for (char d : digits) {
        const int v = std::isdigit(static_cast<unsigned char>(d)) ? d - '0'
                                                                   : std::tolower(static_cast<unsigned char>(d)) - 'a' + 10;
        value = value * base + static_cast<unsigned>(v);
        if (value > 0x10FFFF) return 0x110000;
    }
    return static_cast<char32_t>(value);
}

bool isXmlChar(char32_t c) {
    if (c == '\t' || c == '\n' || c == '\r') return true;
    if (c < 0x20) return false;
    if (c >= 0xD800 && c <= 0xDFFF) return false;
    return c != 0xFFFE && c != 0xFFFF && c <= 0x10FFFF;
}

void locate(std::string_view text, std::size_t offset, int& line, int& column) {
    line = 1;
    column = 1;
    for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
}

struct ScanFailure {
    std::size_t offset{0};
    std::string what;
};

using ValueRewrite = std::function<void(std::string_view value, std::string& out)>;

// Copies markup to out, passing every quoted attribute value through rewrite.
bool rewriteAttributeValues(std::string_view in, std::string& out, const ValueRewrite& rewrite, ScanFailure& failure) {
    out.clear();
    out.reserve(in.size() + in.size() / 64);
    std::size_t i = 0;
    auto copyThrough = [&](std::string_view terminator, const char* what) {
        std::size_t end = in.find(terminator, i);
        if (end == std::string_view::npos) {
            failure.offset = i;
            failure.what = what;
            return false;
        }
        end += terminator.size();
        out.append(in.substr(i, end - i));
        i = end;
        return true;
    };

    while (i < in.size()) {
        if (in[i] != '<') {
            out.push_back(in[i++]);
            continue;
        }
        if (startsWith(in, i, "<!--")) {
            if (!copyThrough("-->", "unterminated comment")) return false;
            continue;
        }
        if (startsWith(in, i, "<![CDATA[")) {
            if (!copyThrough("]]>", "unterminated CDATA section")) return false;
            continue;
        }
        if (startsWith(in, i, "<?")) {
            if (!copyThrough("?>", "unterminated processing instruction")) return false;
            continue;
        }
        if (startsWith(in, i, "<!")) {
            if (!copyThrough(">", "unterminated declaration")) return false;
            continue;
        }

        const std::size_t tagStart = i;
        out.push_back(in[i++]);
        bool closed = false;
        while (i < in.size()) {
            const char c = in[i];
            if (c == '>') {
                out.push_back(c);
                ++i;
                closed = true;
                break;
            }
            if (c == '"' || c == '\'') {
                const std::size_t valueEnd = in.find(c, i + 1);
                if (valueEnd == std::string_view::npos) {
                    failure.offset = i;
                    failure.what = "unterminated attribute value";
                    return false;
                }
                out.push_back(c);
                rewrite(in.substr(i + 1, valueEnd - i - 1), out);
                out.push_back(c);
                i = valueEnd + 1;
                continue;
            }
            out.push_back(c);
            ++i;
        }
        if (!closed) {
            failure.offset = tagStart;
            failure.what = "unterminated tag";
            return false;
        }
    }
    return true;
}
}  // namespace

int replaceIllegalCharacters(std::string& text) {
    std::string out;
    out.reserve(text.size());
    int repairs = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto b = static_cast<unsigned char>(text[i]);
        if (b < 0x80) {
            if (b == 0x00) {
                ++repairs;
            } else if ((b < 0x20 && b != '\t' && b != '\n' && b != '\r') || b == 0x7F) {
                appendUtf8(out, cp437ToUnicode(b));
                ++repairs;
            } else {
                out.push_back(static_cast<char>(b));
            }
            ++i;
            continue;
        }
        const std::size_t len = utf8SequenceLength(text, i);
        if (len == 0) {
            appendUtf8(out, kReplacementChar);
            ++repairs;
            ++i;
            continue;
        }
        out.append(text, i, len);
        i += len;
    }
    text.swap(out);
    return repairs;
}

int normalizeLineBreaks(std::string& text) {
    std::string out;
    out.reserve(text.size());
    int repairs = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\r') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        out.push_back('\n');
        ++repairs;
    }
    text.swap(out);
    return repairs;
}

std::optional<RepairReport> repairMarkup(std::string_view raw, const std::string& sourceName, LoadError& error) {
    const auto start = std::chrono::steady_clock::now();
    RepairReport report{};
    std::string text(raw);

    report.charactersReplaced = replaceIllegalCharacters(text);
    report.lineBreaksRepaired = normalizeLineBreaks(text);

    ScanFailure failure{};
    std::string pass;
    int escapedBreaks = 0;
    const bool breaksOk = rewriteAttributeValues(
        text, pass,
        [&escapedBreaks](std::string_view value, std::string& out) {
            for (char c : value) {
                if (c == '\n') {
                    out.append("&#10;");
                    ++escapedBreaks;
                } else {
                    out.push_back(c);
                }
            }
        },
        failure);

    int escapedEntities = 0;
    int replacedReferences = 0;
    std::string repaired;
    const bool entitiesOk = breaksOk && rewriteAttributeValues(
        pass, repaired,
        [&escapedEntities, &replacedReferences](std::string_view value, std::string& out) {
            for (std::size_t k = 0; k < value.size(); ++k) {
                const char c = value[k];
                if (c == '&' && !isValidReference(value, k)) {
                    out.append("&amp;");
                    ++escapedEntities;
                } else if (c == '&' && value[k + 1] == '#') {
                    // Control characters written as references are CP437 glyphs.
                    const std::size_t semi = value.find(';', k);
                    const char32_t code = numericReference(value, k);
                    if (isXmlChar(code)) {
                        out.append(value.substr(k, semi - k + 1));
                    } else {
                        if (code < 0x20) {
                            if (code != 0) appendUtf8(out, cp437ToUnicode(static_cast<std::uint8_t>(code)));
                        } else {
                            appendUtf8(out, kReplacementChar);
                        }
                        ++replacedReferences;
                    }
                    k = semi;
                } else if (c == '<') {
                    out.append("&lt;");
                    ++escapedEntities;
                } else {
                    out.push_back(c);
                }
            }
        },
        failure);

    if (!entitiesOk) {
        error.kind = LoadErrorKind::MalformedSource;
        error.source = sourceName;
        locate(breaksOk ? std::string_view(pass) : std::string_view(text), failure.offset, error.line, error.column);
        error.message = failure.what;
        logError("Markup repair failed: " + error.describe());
        return std::nullopt;
    }

    report.charactersReplaced += replacedReferences;
    report.lineBreaksRepaired += escapedBreaks;
    report.entitiesEscaped = escapedEntities;
    report.markup = std::move(repaired);

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logInfo("Repaired " + sourceName + ": " + std::to_string(report.charactersReplaced) + " characters, " +
            std::to_string(report.lineBreaksRepaired) + " line breaks, " + std::to_string(report.entitiesEscaped) +
            " entities in " + std::to_string(elapsed) + "s");
    return report;
}

}  // namespace Codex::Markup
