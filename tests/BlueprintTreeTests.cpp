// Inheritance tree linking, index lookups and structural load failures.
#include <algorithm>
#include <cassert>
#include <optional>
#include <string>
#include <vector>

#include "../engine/blueprint/BlueprintTree.h"
#include "SampleBlueprints.h"

using namespace Codex;
using namespace Codex::Blueprints;

static BlueprintRecord record(const std::string& id, std::optional<std::string> parent = std::nullopt) {
    BlueprintRecord r;
    r.id = id;
    r.parentId = std::move(parent);
    r.sourceName = "Test.xml";
    return r;
}

static bool contains(const std::vector<std::string>& ids, const std::string& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

int main() {
    CodexTests::silenceLogs();
    {
        // Children may be declared before their parents.
        LoadError error;
        std::vector<BlueprintRecord> records{record("Snapjaw", "Creature"), record("Object"),
                                             record("Creature", "PhysicalObject"), record("PhysicalObject", "Object"),
                                             record("Torch", "PhysicalObject")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(tree);
        assert(!error.failed());
        assert(tree->size() == 5);
        assert(tree->root().id() == "Object");
        assert(tree->root().isRoot());
        assert(tree->index().size() == 5);
        assert(tree->index().contains("Torch"));
        assert(!tree->index().find("Nope"));

        const BlueprintNode* snapjaw = tree->index().find("Snapjaw");
        assert(snapjaw);
        assert(snapjaw->parent()->id() == "Creature");
        assert(BlueprintTree::inheritsFrom(*snapjaw, "Object"));
        assert(BlueprintTree::inheritsFrom(*snapjaw, "Snapjaw"));
        assert(!BlueprintTree::inheritsFrom(*snapjaw, "Torch"));
        assert(BlueprintTree::inheritancePath(*snapjaw) ==
               "Object\xE2\x9E\x9CPhysicalObject\xE2\x9E\x9C" "Creature\xE2\x9E\x9CSnapjaw");

        auto chain = BlueprintTree::ancestorChain(*snapjaw);
        assert(chain.size() == 4);
        assert(chain.front() == &tree->root());
        assert(chain.back() == snapjaw);

        // Children keep declaration order.
        const BlueprintNode* physical = tree->index().find("PhysicalObject");
        assert(physical->children().size() == 2);
        assert(physical->children()[0]->id() == "Creature");
        assert(physical->children()[1]->id() == "Torch");

        std::vector<std::string> order;
        tree->forEachDepthFirst([&](const BlueprintNode& n) { order.push_back(n.id()); });
        assert((order == std::vector<std::string>{"Object", "PhysicalObject", "Creature", "Snapjaw", "Torch"}));
    }
    {
        // A dangling parent names the missing id.
        LoadError error;
        std::vector<BlueprintRecord> records{record("Object"), record("Orphan", "MissingParent")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::UnresolvedParent);
        assert(contains(error.subjects, "MissingParent"));
        assert(contains(error.subjects, "Orphan"));
        assert(error.message.find("MissingParent") != std::string::npos);
    }
    {
        LoadError error;
        std::vector<BlueprintRecord> records{record("Object"), record("A", "B"), record("B", "C"), record("C", "A")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::CyclicInheritance);
        assert(contains(error.subjects, "A"));
        assert(contains(error.subjects, "B"));
        assert(contains(error.subjects, "C"));
    }
    {
        LoadError error;
        std::vector<BlueprintRecord> records{record("Object"), record("Self", "Self")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::CyclicInheritance);
    }
    {
        LoadError error;
        std::vector<BlueprintRecord> records{record("Object"), record("Other"), record("Child", "Object")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::MultipleRoots);
        assert((error.subjects == std::vector<std::string>{"Object", "Other"}));
    }
    {
        LoadError error;
        auto tree = BlueprintTree::build({}, error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::NoRoot);
    }
    {
        LoadError error;
        std::vector<BlueprintRecord> records{record("Object"), record("Twin", "Object"), record("Twin", "Object")};
        auto tree = BlueprintTree::build(std::move(records), error);
        assert(!tree);
        assert(error.kind == LoadErrorKind::DuplicateBlueprint);
        assert(error.subjects == std::vector<std::string>{"Twin"});
    }
    return 0;
}
