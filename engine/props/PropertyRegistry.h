// Named, typed property definitions that the resolver dispatches to.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "PropertyValue.h"

namespace Codex::Props {

class PropertyContext;

using ComputeFn = std::function<std::optional<PropertyValue>(PropertyContext&)>;

struct PropertyDef {
    std::string name;
    ValueType type{ValueType::Text};
    ComputeFn compute;
    // Used when compute yields nothing or a raw value fails conversion.
    std::optional<PropertyValue> fallback;
    std::string summary;
};

class PropertyRegistry {
public:
    // Later registrations of the same name replace earlier ones.
    void add(PropertyDef def);
    const PropertyDef* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }
    // Registration order.
    std::vector<std::string> names() const;
    std::size_t size() const { return defs_.size(); }

private:
    std::vector<PropertyDef> defs_;
    std::unordered_map<std::string, std::size_t> byName_;
};

}  // namespace Codex::Props
