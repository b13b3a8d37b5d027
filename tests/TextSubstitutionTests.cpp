// Pronoun, subject and verb placeholders in description text.
#include <cassert>
#include <string>

#include "../engine/core/Config.h"
#include "../engine/props/TextSubstitution.h"

using namespace Codex;
using namespace Codex::Props;

int main() {
    const CodexConfig config = defaultConfig();
    const GenderDef* male = config.findGender("male");
    const GenderDef* plural = config.findGender("plural");
    assert(male && plural);

    {
        auto r = substitutePlaceholders("=Pronouns.Subjective= =verb:are= here.", male, "snapjaw");
        assert(r.text == "He is here.");
        assert(r.unresolved.empty());
    }
    {
        auto r = substitutePlaceholders("=pronouns.objective=, =pronouns.possessive=, =pronouns.substantivePossessive=, "
                                        "=pronouns.reflexive=",
                                        male, "snapjaw");
        assert(r.text == "him, his, his, himself");
    }
    {
        auto r = substitutePlaceholders("=Pronouns.Subjective= =verb:are= and =verb:have= =verb:scratch:afterpronoun=",
                                        plural, "snapjaws");
        assert(r.text == "They are and have scratch");
    }
    {
        auto r = substitutePlaceholders("=subject.Subjective= =verb:watch= =Subject.name=.", male, "goatfolk");
        assert(r.text == "he watches Goatfolk.");
    }
    {
        // Unknown tokens stay verbatim and are reported; plain '=' signs are text.
        auto r = substitutePlaceholders("a = b, =pronouns.unknown= and =mystery.token=", male, "x");
        assert(r.text == "a = b, =pronouns.unknown= and =mystery.token=");
        assert(r.unresolved.size() == 2);
        assert(r.unresolved[0] == "=pronouns.unknown=");
        assert(r.unresolved[1] == "=mystery.token=");
    }
    {
        // Without a gender nothing pronoun-shaped can resolve, but the subject name still does.
        auto r = substitutePlaceholders("=pronouns.subjective= =subject.name=", nullptr, "glowfish");
        assert(r.text == "=pronouns.subjective= glowfish");
        assert(r.unresolved.size() == 1);
    }
    {
        assert(conjugate("walk", false) == "walks");
        assert(conjugate("are", false) == "is");
        assert(conjugate("have", false) == "has");
        assert(conjugate("go", false) == "goes");
        assert(conjugate("hiss", false) == "hisses");
        assert(conjugate("fly", false) == "flies");
        assert(conjugate("play", false) == "plays");
        assert(conjugate("walk", true) == "walk");
    }
    return 0;
}
