#include "FragmentMerge.h"

#include <cstring>
#include <unordered_set>

namespace Codex::Props {

using Blueprints::AttributeList;
using Blueprints::BlueprintNode;
using Blueprints::BlueprintRecord;
using Blueprints::findAttribute;
using Blueprints::setAttribute;

namespace {
bool hasPrefix(const std::string& s, const char* prefix) {
    return s.compare(0, std::strlen(prefix), prefix) == 0;
}

std::string applyAppend(const std::string* inherited, const std::string& declared) {
    std::string addition = declared.substr(std::strlen(kAppendMarker));
    if (!inherited || inherited->empty() || *inherited == kNoInheritMarker) return addition;
    if (addition.empty()) return *inherited;
    return *inherited + "," + addition;
}

bool isDeletedTag(const Fragment& f) {
    if (f.kind != "tag") return false;
    const std::string* v = findAttribute(f.attributes, "Value");
    return v && *v == kDeleteMarker;
}

// Attributes that stop at the declaring blueprint.
bool blocksInheritance(const Fragment& inherited, const Fragment* own) {
    for (const auto& kv : inherited.attributes) {
        if (kv.second != kNoInheritMarker) continue;
        if (!own || !findAttribute(own->attributes, kv.first)) return true;
    }
    return false;
}
}  // namespace

const Fragment* FragmentTable::find(const std::string& kind, const std::string& name) const {
    for (const auto& f : fragments_) {
        if (f.kind == kind && f.name == name) return &f;
    }
    return nullptr;
}

const std::string* FragmentTable::value(const std::string& kind,
                                        const std::string& name,
                                        const std::string& attr) const {
    const Fragment* f = find(kind, name);
    if (!f) return nullptr;
    const std::string* v = findAttribute(f->attributes, attr);
    if (v && *v == kNoInheritMarker) return nullptr;
    return v;
}

std::vector<const Fragment*> FragmentTable::ofKind(const std::string& kind) const {
    std::vector<const Fragment*> out;
    for (const auto& f : fragments_) {
        if (f.kind == kind) out.push_back(&f);
    }
    return out;
}

FragmentTable mergeStep(const FragmentTable& inherited, const BlueprintRecord& own) {
    std::unordered_set<std::string> removedParts;
    for (const auto& f : own.fragments) {
        if (f.kind == "removepart") removedParts.insert(f.name);
    }

    FragmentTable out;
    out.fragments_.reserve(inherited.fragments_.size() + own.fragments.size());

    for (const auto& base : inherited.fragments_) {
        const Fragment* mine = own.findFragment(base.kind, base.name);
        if (!mine) {
            if (base.kind == "part" && removedParts.count(base.name)) continue;
            if (blocksInheritance(base, nullptr)) continue;
            out.fragments_.push_back(base);
            continue;
        }
        if (isDeletedTag(*mine)) continue;
        if (blocksInheritance(base, mine)) continue;

        Fragment merged{base.kind, base.name, {}};
        for (const auto& kv : base.attributes) {
            const std::string* declared = findAttribute(mine->attributes, kv.first);
            if (!declared) {
                merged.attributes.push_back(kv);
            } else if (hasPrefix(*declared, kAppendMarker)) {
                merged.attributes.emplace_back(kv.first, applyAppend(&kv.second, *declared));
            } else {
                merged.attributes.emplace_back(kv.first, *declared);
            }
        }
        for (const auto& kv : mine->attributes) {
            if (findAttribute(base.attributes, kv.first)) continue;
            if (hasPrefix(kv.second, kAppendMarker)) {
                setAttribute(merged.attributes, kv.first, applyAppend(nullptr, kv.second));
            } else {
                setAttribute(merged.attributes, kv.first, kv.second);
            }
        }
        out.fragments_.push_back(std::move(merged));
    }

    for (const auto& f : own.fragments) {
        if (inherited.find(f.kind, f.name)) continue;
        // Nothing to delete.
        if (isDeletedTag(f)) continue;
        Fragment added{f.kind, f.name, {}};
        added.attributes.reserve(f.attributes.size());
        for (const auto& kv : f.attributes) {
            if (hasPrefix(kv.second, kAppendMarker)) {
                added.attributes.emplace_back(kv.first, applyAppend(nullptr, kv.second));
            } else {
                added.attributes.push_back(kv);
            }
        }
        out.fragments_.push_back(std::move(added));
    }
    return out;
}

FragmentTable mergeChain(const std::vector<const BlueprintNode*>& chain) {
    FragmentTable table;
    for (const BlueprintNode* node : chain) {
        table = mergeStep(table, node->record());
    }
    return table;
}

}  // namespace Codex::Props
