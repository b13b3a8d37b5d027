// Replaces =pronouns.x=, =subject.name= and =verb:x= placeholders in description text.
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "../core/Config.h"

namespace Codex::Props {

struct SubstitutionResult {
    std::string text;
    // Placeholder tokens left verbatim, including their '=' delimiters.
    std::vector<std::string> unresolved;
};

// gender may be null, in which case pronoun and verb placeholders stay unresolved.
SubstitutionResult substitutePlaceholders(std::string_view text,
                                          const GenderDef* gender,
                                          std::string_view subjectName);

// Third person form of verb: "walk" -> "walks", "are" -> "is"; plural keeps it unchanged.
std::string conjugate(std::string_view verb, bool plural);

}  // namespace Codex::Props
