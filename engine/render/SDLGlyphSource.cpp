#include "SDLGlyphSource.h"

#include <cstring>

#include <SDL.h>
#include <SDL_image.h>

#include "../core/Logger.h"

namespace Codex::Render {

std::optional<PixelBuffer> SDLGlyphSource::loadFile(const std::string& fullPath) {
    SDL_Surface* surface = IMG_Load(fullPath.c_str());
    if (!surface) {
        logWarn(std::string("IMG_Load failed: ") + fullPath + " | " + IMG_GetError());
        return std::nullopt;
    }
    SDL_Surface* rgba = SDL_ConvertSurfaceFormat(surface, SDL_PIXELFORMAT_RGBA32, 0);
    SDL_FreeSurface(surface);
    if (!rgba) {
        logWarn(std::string("Failed to convert ") + fullPath + " to RGBA | " + SDL_GetError());
        return std::nullopt;
    }

    PixelBuffer buf = PixelBuffer::blank(rgba->w, rgba->h);
    if (SDL_MUSTLOCK(rgba) && SDL_LockSurface(rgba) != 0) {
        logWarn(std::string("Failed to lock surface for ") + fullPath + " | " + SDL_GetError());
        SDL_FreeSurface(rgba);
        return std::nullopt;
    }
    const auto* src = static_cast<const std::uint8_t*>(rgba->pixels);
    for (int y = 0; y < rgba->h; ++y) {
        std::memcpy(buf.rgba.data() + static_cast<std::size_t>(y) * buf.pitch(),
                    src + static_cast<std::size_t>(y) * rgba->pitch, static_cast<std::size_t>(buf.pitch()));
    }
    if (SDL_MUSTLOCK(rgba)) SDL_UnlockSurface(rgba);
    SDL_FreeSurface(rgba);
    return buf;
}

std::optional<PixelBuffer> SDLGlyphSource::load(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(path);
    if (it != cache_.end()) {
        return it->second;
    }
    const std::string full = root_.empty() ? path : root_ + "/" + path;
    auto loaded = loadFile(full);
    if (!loaded) {
        logWarn("SDLGlyphSource: failed to load " + full);
    }
    cache_[path] = loaded;
    return loaded;
}

}  // namespace Codex::Render
