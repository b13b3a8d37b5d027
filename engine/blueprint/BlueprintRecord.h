// Raw blueprint data as declared in markup, before inheritance is applied.
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Codex::Blueprints {

// Ordered attribute list; blueprints carry a handful per fragment, so lookup is linear.
using AttributeList = std::vector<std::pair<std::string, std::string>>;

const std::string* findAttribute(const AttributeList& attrs, const std::string& key);
// Inserts or overwrites key, keeping first-declaration order.
void setAttribute(AttributeList& attrs, const std::string& key, std::string value);

// One <part>, <tag>, <stat>, ... element. Unknown kinds are kept as-is.
struct Fragment {
    std::string kind;
    std::string name;
    AttributeList attributes;
};

struct BlueprintRecord {
    std::string id;
    std::optional<std::string> parentId;
    std::vector<Fragment> fragments;
    std::string rawSource;
    std::string sourceName;
    int line{0};

    const Fragment* findFragment(const std::string& kind, const std::string& name) const;
};

}  // namespace Codex::Blueprints
