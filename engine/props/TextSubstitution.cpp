#include "TextSubstitution.h"

#include <cctype>
#include <optional>

namespace Codex::Props {

namespace {
std::string lower(std::string_view s) {
    std::string out(s);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool isTokenChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == ':' || c == '_';
}

// A placeholder body: identifier characters only, with a '.' or ':' separating head and field.
bool looksLikePlaceholder(std::string_view body) {
    if (body.empty()) return false;
    bool separated = false;
    for (char c : body) {
        if (!isTokenChar(c)) return false;
        if (c == '.' || c == ':') separated = true;
    }
    return separated && body.front() != '.' && body.front() != ':';
}

std::string capitalized(std::string s) {
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

bool isVowel(char c) {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'a':
        case 'e':
        case 'i':
        case 'o':
        case 'u':
            return true;
        default:
            return false;
    }
}

bool endsWith(const std::string& s, const char* suffix) {
    const std::string_view sv(suffix);
    return s.size() >= sv.size() && s.compare(s.size() - sv.size(), sv.size(), sv) == 0;
}

std::optional<std::string> pronounField(const GenderDef& g, const std::string& field) {
    if (field == "subjective") return g.subjective;
    if (field == "objective") return g.objective;
    if (field == "possessive" || field == "possessiveadjective") return g.possessiveAdjective;
    if (field == "substantivepossessive") return g.substantivePossessive;
    if (field == "reflexive") return g.reflexive;
    return std::nullopt;
}

std::optional<std::string> resolveToken(std::string_view body, const GenderDef* gender, std::string_view subjectName) {
    const std::size_t sep = body.find_first_of(".:");
    const std::string head = lower(body.substr(0, sep));
    const bool upper = std::isupper(static_cast<unsigned char>(body.front())) != 0;
    std::string_view rest = body.substr(sep + 1);

    if (body[sep] == ':') {
        if (head != "verb" || !gender) return std::nullopt;
        // Trailing qualifiers such as ":afterpronoun" do not change the form.
        const std::string verb(rest.substr(0, rest.find(':')));
        if (verb.empty()) return std::nullopt;
        std::string form = conjugate(verb, gender->plural);
        return upper ? capitalized(std::move(form)) : form;
    }

    if (head != "pronouns" && head != "subject") return std::nullopt;
    const std::string field = lower(rest);
    std::optional<std::string> out;
    if (head == "subject" && field == "name") {
        if (subjectName.empty()) return std::nullopt;
        out = std::string(subjectName);
    } else if (gender) {
        out = pronounField(*gender, field);
    }
    if (!out) return std::nullopt;
    return upper ? capitalized(std::move(*out)) : *out;
}
}  // namespace

std::string conjugate(std::string_view verb, bool plural) {
    std::string v(verb);
    if (plural || v.empty()) return v;
    const std::string l = lower(v);
    if (l == "are") return "is";
    if (l == "have") return "has";
    if (l == "were") return "was";
    if (l == "do") return "does";
    if (l == "go") return "goes";
    if (endsWith(l, "s") || endsWith(l, "sh") || endsWith(l, "ch") || endsWith(l, "x") || endsWith(l, "z") ||
        endsWith(l, "o")) {
        return v + "es";
    }
    if (l.size() >= 2 && l.back() == 'y' && !isVowel(l[l.size() - 2])) {
        return v.substr(0, v.size() - 1) + "ies";
    }
    return v + "s";
}

SubstitutionResult substitutePlaceholders(std::string_view text,
                                          const GenderDef* gender,
                                          std::string_view subjectName) {
    SubstitutionResult result;
    result.text.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '=') {
            result.text.push_back(text[i++]);
            continue;
        }
        const std::size_t close = text.find('=', i + 1);
        if (close == std::string_view::npos) {
            result.text.append(text.substr(i));
            break;
        }
        const std::string_view body = text.substr(i + 1, close - i - 1);
        if (!looksLikePlaceholder(body)) {
            result.text.push_back('=');
            ++i;
            continue;
        }
        const std::string_view token = text.substr(i, close - i + 1);
        if (auto replacement = resolveToken(body, gender, subjectName)) {
            result.text += *replacement;
        } else {
            result.text.append(token);
            result.unresolved.emplace_back(token);
        }
        i = close + 1;
    }
    return result;
}

}  // namespace Codex::Props
