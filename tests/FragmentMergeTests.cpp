// Override, append and removal rules applied when folding an ancestor chain.
#include <cassert>
#include <string>

#include "../engine/props/FragmentMerge.h"

using namespace Codex::Blueprints;
using namespace Codex::Props;

static BlueprintRecord record(const std::string& id, std::vector<Fragment> fragments) {
    BlueprintRecord r;
    r.id = id;
    r.fragments = std::move(fragments);
    return r;
}

int main() {
    const FragmentTable empty;
    {
        // The nearest declaration wins; undeclared attributes fall through to the ancestor.
        auto base = mergeStep(empty, record("Base", {{"part", "Render", {{"Tile", "a.bmp"}, {"ColorString", "&y"}}},
                                                     {"tag", "Old", {}}}));
        auto child = mergeStep(base, record("Child", {{"part", "Render", {{"ColorString", "&R"}, {"DetailColor", "W"}}},
                                                      {"tag", "New", {}}}));
        assert(*child.value("part", "Render", "Tile") == "a.bmp");
        assert(*child.value("part", "Render", "ColorString") == "&R");
        assert(*child.value("part", "Render", "DetailColor") == "W");
        // Inherited fragments keep their place, new ones follow.
        auto tags = child.ofKind("tag");
        assert(tags.size() == 2);
        assert(tags[0]->name == "Old");
        assert(tags[1]->name == "New");
        // The ancestor's table is untouched.
        assert(*base.value("part", "Render", "ColorString") == "&y");
        assert(!base.find("tag", "New"));
    }
    {
        auto base = mergeStep(empty, record("Base", {{"part", "Brain", {{"Factions", "Joppa-100"}}}}));
        auto mid = mergeStep(base, record("Mid", {{"part", "Brain", {{"Factions", "*append:Apes-50"}}}}));
        auto leaf = mergeStep(mid, record("Leaf", {{"part", "Brain", {{"Factions", "*append:Birds-10"}}}}));
        assert(*leaf.value("part", "Brain", "Factions") == "Joppa-100,Apes-50,Birds-10");
        // Appending with nothing inherited just strips the marker.
        auto fresh = mergeStep(empty, record("Fresh", {{"part", "Brain", {{"Factions", "*append:Fish-5"}}}}));
        assert(*fresh.value("part", "Brain", "Factions") == "Fish-5");
        // A plain value resets the accumulated list.
        auto reset = mergeStep(leaf, record("Reset", {{"part", "Brain", {{"Factions", "Robots-100"}}}}));
        assert(*reset.value("part", "Brain", "Factions") == "Robots-100");
    }
    {
        auto base = mergeStep(empty, record("Base", {{"part", "Corpse", {{"CorpseChance", "10"}}},
                                                     {"part", "Physics", {{"Weight", "3"}}},
                                                     {"tag", "Gender", {{"Value", "male"}}}}));
        auto child = mergeStep(base, record("Child", {{"removepart", "Corpse", {}},
                                                      {"tag", "Gender", {{"Value", "*delete"}}},
                                                      {"tag", "Lonely", {{"Value", "*delete"}}}}));
        assert(!child.find("part", "Corpse"));
        assert(child.find("part", "Physics"));
        assert(!child.find("tag", "Gender"));
        // Deleting a tag nobody declared leaves nothing behind.
        assert(!child.find("tag", "Lonely"));
        // A descendant may declare the tag again.
        auto grandchild = mergeStep(child, record("Grandchild", {{"tag", "Gender", {{"Value", "female"}}}}));
        assert(*grandchild.value("tag", "Gender", "Value") == "female");
    }
    {
        // "*noinherit" stops at the declaring blueprint.
        auto base = mergeStep(empty, record("Base", {{"tag", "BaseObject", {{"Value", "*noinherit"}}},
                                                     {"part", "Render", {{"Tile", "x.bmp"}}}}));
        assert(base.find("tag", "BaseObject"));
        assert(!base.value("tag", "BaseObject", "Value"));
        auto child = mergeStep(base, record("Child", {}));
        assert(!child.find("tag", "BaseObject"));
        assert(child.find("part", "Render"));
        auto redeclared = mergeStep(base, record("Other", {{"tag", "BaseObject", {{"Value", "*noinherit"}}}}));
        assert(redeclared.find("tag", "BaseObject"));
    }
    {
        BlueprintRecord none;
        auto table = mergeStep(empty, none);
        assert(table.empty());
    }
    return 0;
}
