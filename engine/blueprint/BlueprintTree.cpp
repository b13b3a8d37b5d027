#include "BlueprintTree.h"

#include <algorithm>

#include "../core/Logger.h"

namespace Codex::Blueprints {

namespace {
constexpr const char* kPathSeparator = "\xE2\x9E\x9C";  // ➜

std::string joinIds(const std::vector<std::string>& ids, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += sep;
        out += ids[i];
    }
    return out;
}
}  // namespace

std::optional<BlueprintTree> BlueprintTree::build(std::vector<BlueprintRecord> records, LoadError& error) {
    BlueprintTree tree;
    tree.nodes_.reserve(records.size());
    tree.index_.byId_.reserve(records.size());

    // Pass 1: arena + index.
    for (auto& record : records) {
        auto node = std::make_unique<BlueprintNode>();
        node->slot_ = tree.nodes_.size();
        node->record_ = std::move(record);
        if (!tree.index_.byId_.emplace(node->record_.id, node.get()).second) {
            error.kind = LoadErrorKind::DuplicateBlueprint;
            error.source = node->record_.sourceName;
            error.line = node->record_.line;
            error.subjects = {node->record_.id};
            error.message = "blueprint " + node->record_.id + " is declared more than once";
            logError("Tree build failed: " + error.describe());
            return std::nullopt;
        }
        tree.nodes_.push_back(std::move(node));
    }

    // Pass 2: parent links. Parents may appear after their children in source order.
    std::vector<const BlueprintNode*> roots;
    for (auto& nodePtr : tree.nodes_) {
        BlueprintNode& node = *nodePtr;
        const auto& parentId = node.record_.parentId;
        if (!parentId) {
            roots.push_back(&node);
            continue;
        }
        auto it = tree.index_.byId_.find(*parentId);
        if (it == tree.index_.byId_.end()) {
            error.kind = LoadErrorKind::UnresolvedParent;
            error.source = node.record_.sourceName;
            error.line = node.record_.line;
            error.subjects = {*parentId, node.id()};
            error.message = "blueprint " + node.id() + " inherits from unknown blueprint " + *parentId;
            logError("Tree build failed: " + error.describe());
            return std::nullopt;
        }
        const BlueprintNode* parent = it->second;

        std::vector<std::string> walk{node.id()};
        for (const BlueprintNode* up = parent; up != nullptr; up = up->parent_) {
            walk.push_back(up->id());
            if (up == &node) {
                error.kind = LoadErrorKind::CyclicInheritance;
                error.source = node.record_.sourceName;
                error.line = node.record_.line;
                error.subjects = walk;
                error.message = "inheritance cycle " + joinIds(walk, " -> ");
                logError("Tree build failed: " + error.describe());
                return std::nullopt;
            }
        }
        node.parent_ = parent;
        tree.nodes_[parent->slot_]->children_.push_back(&node);
    }

    if (roots.empty()) {
        error.kind = LoadErrorKind::NoRoot;
        error.message = "no blueprint is free of a parent";
        logError("Tree build failed: " + error.describe());
        return std::nullopt;
    }
    if (roots.size() > 1) {
        error.kind = LoadErrorKind::MultipleRoots;
        for (const auto* r : roots) error.subjects.push_back(r->id());
        error.message = "more than one root blueprint: " + joinIds(error.subjects, ", ");
        logError("Tree build failed: " + error.describe());
        return std::nullopt;
    }
    tree.root_ = roots.front();
    logInfo("Built blueprint tree: " + std::to_string(tree.nodes_.size()) + " nodes rooted at " + tree.root_->id());
    return tree;
}

std::vector<const BlueprintNode*> BlueprintTree::ancestorChain(const BlueprintNode& node) {
    std::vector<const BlueprintNode*> chain;
    for (const BlueprintNode* n = &node; n != nullptr; n = n->parent()) chain.push_back(n);
    std::reverse(chain.begin(), chain.end());
    return chain;
}

bool BlueprintTree::inheritsFrom(const BlueprintNode& node, const std::string& id) {
    for (const BlueprintNode* n = &node; n != nullptr; n = n->parent()) {
        if (n->id() == id) return true;
    }
    return false;
}

std::string BlueprintTree::inheritancePath(const BlueprintNode& node) {
    std::vector<std::string> ids;
    for (const auto* n : ancestorChain(node)) ids.push_back(n->id());
    return joinIds(ids, kPathSeparator);
}

}  // namespace Codex::Blueprints
