// The Caves of Qud property catalog: derived stats, descriptions and render fields.
#pragma once

#include "../../engine/props/PropertyRegistry.h"

namespace Qud::Catalog {

// Blueprints inheriting from these are characters: inventories, attributes, combat stats.
inline constexpr const char* kActiveCharacters[] = {"Creature", "ActivePlant"};
// Immobile things that still carry combat stats but no attributes.
inline constexpr const char* kInactiveCharacters[] = {"BaseFungus", "Baetyl", "Wall", "Furniture"};

void registerObjectProps(Codex::Props::PropertyRegistry& registry);

}  // namespace Qud::Catalog
