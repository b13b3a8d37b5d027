// Glyph source reading image files under a texture root via SDL_image, with a path cache.
#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

#include "GlyphSource.h"

namespace Codex::Render {

class SDLGlyphSource : public GlyphSource {
public:
    explicit SDLGlyphSource(std::string textureRoot) : root_(std::move(textureRoot)) {}

    std::optional<PixelBuffer> load(const std::string& path) override;

    // Decodes any SDL_image-supported file into RGBA; no caching.
    static std::optional<PixelBuffer> loadFile(const std::string& fullPath);

private:
    std::string root_;
    std::mutex mutex_;
    // Misses are cached too so a missing file is only reported once.
    std::unordered_map<std::string, std::optional<PixelBuffer>> cache_;
};

}  // namespace Codex::Render
