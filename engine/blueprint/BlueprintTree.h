// Single-rooted inheritance tree of blueprints plus the id -> node index.
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/Diagnostics.h"
#include "BlueprintRecord.h"

namespace Codex::Blueprints {

class BlueprintNode {
public:
    const BlueprintRecord& record() const { return record_; }
    const std::string& id() const { return record_.id; }
    const BlueprintNode* parent() const { return parent_; }
    const std::vector<const BlueprintNode*>& children() const { return children_; }
    bool isRoot() const { return parent_ == nullptr; }
    // Stable arena position; usable as a dense cache key.
    std::size_t slot() const { return slot_; }

private:
    friend class BlueprintTree;

    BlueprintRecord record_;
    const BlueprintNode* parent_{nullptr};
    std::vector<const BlueprintNode*> children_;
    std::size_t slot_{0};
};

class CharacterIndex {
public:
    const BlueprintNode* find(const std::string& id) const {
        auto it = byId_.find(id);
        return it != byId_.end() ? it->second : nullptr;
    }
    bool contains(const std::string& id) const { return byId_.count(id) != 0; }
    std::size_t size() const { return byId_.size(); }

private:
    friend class BlueprintTree;
    std::unordered_map<std::string, const BlueprintNode*> byId_;
};

class BlueprintTree {
public:
    // Two-pass build: every node is created and indexed first, then linked to its parent.
    static std::optional<BlueprintTree> build(std::vector<BlueprintRecord> records, LoadError& error);

    const BlueprintNode& root() const { return *root_; }
    const CharacterIndex& index() const { return index_; }
    std::size_t size() const { return nodes_.size(); }

    // Root first, node last.
    static std::vector<const BlueprintNode*> ancestorChain(const BlueprintNode& node);
    // True if node is id or descends from it.
    static bool inheritsFrom(const BlueprintNode& node, const std::string& id);
    // "Object➜PhysicalObject➜Creature➜Snapjaw"
    static std::string inheritancePath(const BlueprintNode& node);

    // Pre-order walk in declaration order.
    template <typename Fn>
    void forEachDepthFirst(Fn&& fn) const {
        std::vector<const BlueprintNode*> stack{root_};
        while (!stack.empty()) {
            const BlueprintNode* n = stack.back();
            stack.pop_back();
            fn(*n);
            for (auto it = n->children().rbegin(); it != n->children().rend(); ++it) stack.push_back(*it);
        }
    }

private:
    BlueprintTree() = default;

    std::vector<std::unique_ptr<BlueprintNode>> nodes_;
    const BlueprintNode* root_{nullptr};
    CharacterIndex index_;
};

}  // namespace Codex::Blueprints
