#include "PngEncoder.h"

#include <algorithm>
#include <cstring>
#include <memory>
#include <string>

#include <SDL.h>
#include <SDL_image.h>

#include "../core/Logger.h"

namespace Codex::Render {

namespace {
using SurfacePtr = std::unique_ptr<SDL_Surface, decltype(&SDL_FreeSurface)>;

// Growable in-memory RWops target for IMG_SavePNG_RW.
struct MemoryTarget {
    std::vector<std::uint8_t>* bytes{nullptr};
    std::size_t position{0};
};

MemoryTarget* targetOf(SDL_RWops* rw) {
    return static_cast<MemoryTarget*>(rw->hidden.unknown.data1);
}

Sint64 SDLCALL memSize(SDL_RWops* rw) {
    return static_cast<Sint64>(targetOf(rw)->bytes->size());
}

Sint64 SDLCALL memSeek(SDL_RWops* rw, Sint64 offset, int whence) {
    MemoryTarget* t = targetOf(rw);
    Sint64 base = 0;
    if (whence == RW_SEEK_CUR) {
        base = static_cast<Sint64>(t->position);
    } else if (whence == RW_SEEK_END) {
        base = static_cast<Sint64>(t->bytes->size());
    }
    const Sint64 target = base + offset;
    if (target < 0) return SDL_SetError("seek before start of buffer");
    t->position = static_cast<std::size_t>(target);
    return target;
}

size_t SDLCALL memRead(SDL_RWops* rw, void* ptr, size_t size, size_t num) {
    MemoryTarget* t = targetOf(rw);
    if (size == 0 || t->position >= t->bytes->size()) return 0;
    const std::size_t avail = (t->bytes->size() - t->position) / size;
    const std::size_t count = std::min(avail, num);
    std::memcpy(ptr, t->bytes->data() + t->position, count * size);
    t->position += count * size;
    return count;
}

size_t SDLCALL memWrite(SDL_RWops* rw, const void* ptr, size_t size, size_t num) {
    MemoryTarget* t = targetOf(rw);
    const std::size_t len = size * num;
    if (len == 0) return 0;
    if (t->position + len > t->bytes->size()) t->bytes->resize(t->position + len);
    std::memcpy(t->bytes->data() + t->position, ptr, len);
    t->position += len;
    return num;
}

int SDLCALL memClose(SDL_RWops* rw) {
    SDL_FreeRW(rw);
    return 0;
}

SurfacePtr wrap(const PixelBuffer& image) {
    // SDL only reads from the pixels while saving.
    void* pixels = const_cast<std::uint8_t*>(image.rgba.data());
    return SurfacePtr(SDL_CreateRGBSurfaceWithFormatFrom(pixels, image.width, image.height, 32, image.pitch(),
                                                         SDL_PIXELFORMAT_RGBA32),
                      &SDL_FreeSurface);
}
}  // namespace

std::optional<std::vector<std::uint8_t>> PngEncoder::encode(const PixelBuffer& image) {
    if (image.empty()) {
        logWarn("PngEncoder: refusing to encode an empty image");
        return std::nullopt;
    }
    SurfacePtr surface = wrap(image);
    if (!surface) {
        logWarn(std::string("PngEncoder: surface creation failed | ") + SDL_GetError());
        return std::nullopt;
    }

    std::vector<std::uint8_t> bytes;
    MemoryTarget target{&bytes, 0};
    SDL_RWops* rw = SDL_AllocRW();
    if (!rw) {
        logWarn(std::string("PngEncoder: SDL_AllocRW failed | ") + SDL_GetError());
        return std::nullopt;
    }
    rw->type = SDL_RWOPS_UNKNOWN;
    rw->size = memSize;
    rw->seek = memSeek;
    rw->read = memRead;
    rw->write = memWrite;
    rw->close = memClose;
    rw->hidden.unknown.data1 = &target;

    // freedst = 1: SDL_image closes the RWops, which frees it.
    if (IMG_SavePNG_RW(surface.get(), rw, 1) != 0) {
        logWarn(std::string("PngEncoder: IMG_SavePNG_RW failed | ") + IMG_GetError());
        return std::nullopt;
    }
    return bytes;
}

}  // namespace Codex::Render
