#include "PropertyRegistry.h"

#include "../core/Logger.h"

namespace Codex::Props {

void PropertyRegistry::add(PropertyDef def) {
    if (def.name.empty() || !def.compute) {
        logWarn("Ignoring property definition without a name or compute function");
        return;
    }
    auto it = byName_.find(def.name);
    if (it != byName_.end()) {
        logDebug("Property redefined: " + def.name);
        defs_[it->second] = std::move(def);
        return;
    }
    byName_.emplace(def.name, defs_.size());
    defs_.push_back(std::move(def));
}

const PropertyDef* PropertyRegistry::find(const std::string& name) const {
    auto it = byName_.find(name);
    return it != byName_.end() ? &defs_[it->second] : nullptr;
}

std::vector<std::string> PropertyRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(defs_.size());
    for (const auto& d : defs_) out.push_back(d.name);
    return out;
}

}  // namespace Codex::Props
