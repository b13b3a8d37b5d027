// Supplier of base glyph pixels by path; the compositor never touches files itself.
#pragma once

#include <optional>
#include <string>

#include "PixelBuffer.h"

namespace Codex::Render {

class GlyphSource {
public:
    virtual ~GlyphSource() = default;
    // RGBA pixels of the glyph at path (relative to the texture root), or nullopt if unavailable.
    virtual std::optional<PixelBuffer> load(const std::string& path) = 0;
};

// Repairs paths as blueprints spell them: "assets_content_textures_Items/sw_x.bmp" becomes
// "Items/sw_x.bmp", backslashes become slashes and the first letter is capitalized.
std::string repairGlyphPath(std::string path);

}  // namespace Codex::Render
