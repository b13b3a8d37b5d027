// PNG encoding of pixel buffers through SDL_image.
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "PixelBuffer.h"

namespace Codex::Render {

class PngEncoder {
public:
    // Encodes into memory; nullopt if the buffer is empty or SDL_image fails.
    static std::optional<std::vector<std::uint8_t>> encode(const PixelBuffer& image);
};

}  // namespace Codex::Render
