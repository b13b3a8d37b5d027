// Folds the fragments of an ancestor chain into the table a node effectively carries.
#pragma once

#include <string>
#include <vector>

#include "../blueprint/BlueprintTree.h"

namespace Codex::Props {

using Blueprints::Fragment;

// Value prefixes understood by the merge.
inline constexpr const char* kAppendMarker = "*append:";
inline constexpr const char* kDeleteMarker = "*delete";
inline constexpr const char* kNoInheritMarker = "*noinherit";

class FragmentTable {
public:
    const Fragment* find(const std::string& kind, const std::string& name) const;
    const std::string* value(const std::string& kind, const std::string& name, const std::string& attr) const;
    // Fragments of one kind, ancestors' first.
    std::vector<const Fragment*> ofKind(const std::string& kind) const;
    const std::vector<Fragment>& all() const { return fragments_; }
    bool empty() const { return fragments_.empty(); }

private:
    friend FragmentTable mergeStep(const FragmentTable& inherited, const Blueprints::BlueprintRecord& own);
    std::vector<Fragment> fragments_;
};

// Applies one record on top of what its parent resolved to:
//  - an attribute the record declares overrides the inherited one;
//  - "*append:x" extends the inherited value as a comma-separated list;
//  - <removepart Name="X"/> drops inherited part X;
//  - a tag declared with Value="*delete" drops the inherited tag;
//  - an inherited fragment holding a "*noinherit" attribute is dropped unless the record
//    redeclares that attribute.
FragmentTable mergeStep(const FragmentTable& inherited, const Blueprints::BlueprintRecord& own);

// Folds root to node.
FragmentTable mergeChain(const std::vector<const Blueprints::BlueprintNode*>& chain);

}  // namespace Codex::Props
