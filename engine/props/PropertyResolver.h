// Lazy, memoized resolution of named properties over the blueprint inheritance tree.
#pragma once

#include <atomic>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../blueprint/BlueprintTree.h"
#include "../core/Config.h"
#include "../core/Diagnostics.h"
#include "FragmentMerge.h"
#include "PropertyRegistry.h"
#include "PropertyValue.h"

namespace Codex::Props {

using Blueprints::BlueprintNode;
using Blueprints::BlueprintTree;

enum class PropertyStatus { Ok, Absent, TypeError, UnknownProperty };

std::string_view toLabel(PropertyStatus status);

struct PropertyResult {
    PropertyStatus status{PropertyStatus::Absent};
    std::optional<PropertyValue> value;
    std::string message;
    bool defaulted{false};  // value is the definition's fallback, not a declared one

    bool ok() const { return status == PropertyStatus::Ok; }
    // Formatted value, or empty when there is none.
    std::string text() const { return value ? formatValue(*value) : std::string(); }
};

class PropertyResolver;

// Everything a property's compute function may look at while resolving one node.
class PropertyContext {
public:
    const BlueprintNode& node() const { return node_; }
    const std::string& id() const { return node_.id(); }
    const std::string& propertyName() const { return property_; }
    const FragmentTable& fragments() const { return table_; }
    const BlueprintTree& tree() const;
    const CodexConfig& config() const;

    // Merged raw attribute, or null when nothing in the chain declares it.
    const std::string* raw(const std::string& kind, const std::string& name, const std::string& attr) const;
    bool has(const std::string& kind, const std::string& name) const;
    // Declared on this node's own record, not inherited.
    bool isSpecified(const std::string& kind, const std::string& name) const;
    bool isSpecified(const std::string& kind, const std::string& name, const std::string& attr) const;
    bool inheritsFrom(const std::string& id) const;
    bool inheritsFromAny(std::initializer_list<const char*> ids) const;

    // Typed reads. A declared value that fails conversion records a type error and yields nullopt.
    std::optional<int> integer(const std::string& kind, const std::string& name, const std::string& attr);
    std::optional<double> decimal(const std::string& kind, const std::string& name, const std::string& attr);
    std::optional<bool> boolean(const std::string& kind, const std::string& name, const std::string& attr);
    std::optional<int> toInt(const std::string& rawValue, const std::string& what);

    // Another property of the same node, or of another node. Both go through the cache.
    std::optional<PropertyValue> property(const std::string& name);
    PropertyResult resolveOn(const BlueprintNode& other, const std::string& name);
    const BlueprintNode* lookup(const std::string& id) const;

    // Gender from the node's Gender tag, else the configured default. May be null.
    const GenderDef* gender() const;
    // Fills placeholders; unresolved ones stay verbatim and are logged as diagnostics.
    std::string substitute(const std::string& text);

    void typeError(const std::string& message);
    bool hasTypeError() const { return !typeError_.empty(); }
    const std::string& typeErrorMessage() const { return typeError_; }
    void note(DiagnosticKind kind, const std::string& subject, const std::string& message);

private:
    friend class PropertyResolver;
    PropertyContext(const PropertyResolver& resolver,
                    const BlueprintNode& node,
                    const FragmentTable& table,
                    const std::string& property)
        : resolver_(resolver), node_(node), table_(table), property_(property) {}

    const PropertyResolver& resolver_;
    const BlueprintNode& node_;
    const FragmentTable& table_;
    const std::string& property_;
    std::string typeError_;
};

class PropertyResolver {
public:
    PropertyResolver(const BlueprintTree& tree,
                     const PropertyRegistry& registry,
                     const CodexConfig& config,
                     DiagnosticLog& diagnostics);
    PropertyResolver(const PropertyResolver&) = delete;
    PropertyResolver& operator=(const PropertyResolver&) = delete;

    // Registered names dispatch to their definition; otherwise "kind.name.attr" reads the merged
    // attribute and "kind.name" reports whether the fragment is present.
    PropertyResult resolve(const BlueprintNode& node, const std::string& name) const;
    PropertyResult resolve(const std::string& id, const std::string& name) const;

    // Merged fragments of node, built from the nearest ancestor already merged.
    const FragmentTable& fragments(const BlueprintNode& node) const;

    const BlueprintTree& tree() const { return tree_; }
    const PropertyRegistry& registry() const { return registry_; }
    const CodexConfig& config() const { return config_; }
    DiagnosticLog& diagnostics() const { return diagnostics_; }

    // Counters exposed for tests and load statistics.
    std::size_t computeCount() const { return computeCount_.load(); }
    std::size_t mergeCount() const { return mergeCount_.load(); }

private:
    PropertyResult compute(const BlueprintNode& node, const std::string& name) const;
    PropertyResult resolvePath(const BlueprintNode& node, const std::string& path) const;

    const BlueprintTree& tree_;
    const PropertyRegistry& registry_;
    const CodexConfig& config_;
    DiagnosticLog& diagnostics_;

    mutable std::mutex tableMutex_;
    mutable std::vector<std::unique_ptr<const FragmentTable>> tables_;
    mutable std::mutex resultMutex_;
    mutable std::vector<std::unordered_map<std::string, PropertyResult>> results_;
    mutable std::atomic<std::size_t> computeCount_{0};
    mutable std::atomic<std::size_t> mergeCount_{0};
};

}  // namespace Codex::Props
