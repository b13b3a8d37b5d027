// Derives tile rendering attributes from a blueprint's merged Render part.
#pragma once

#include <optional>
#include <string>

#include "../../engine/props/FragmentMerge.h"
#include "../../engine/render/TileCompositor.h"

namespace Qud::Catalog {

// Base objects never render; otherwise a Render Tile or a PaintedWall/PaintedFence tag is required.
bool hasTile(const Codex::Props::FragmentTable& fragments);

// ColorString "&Y^k" gives color Y and background k unless TileColor overrides the color.
// PaintedFence and PaintedWall tags choose the glyph from their paint path and may move the
// secondary color into the background; Walltrap parts are colored from WarmColor.
// Overlay layers come from <overlay Tile=".." Color=".." Detail=".."/> fragments in order.
std::optional<Codex::Render::RenderAttributes> renderAttributesFor(const Codex::Props::FragmentTable& fragments,
                                                                   const std::string& blueprint = {});

// RenderString as displayed: numeric strings are CP437 code points, gases use a shade block.
std::optional<std::string> renderCharacter(const Codex::Props::FragmentTable& fragments);

}  // namespace Qud::Catalog
