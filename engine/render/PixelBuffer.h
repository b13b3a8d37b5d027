// Tightly packed 8-bit RGBA image.
#pragma once

#include <cstdint>
#include <vector>

#include "Color.h"

namespace Codex::Render {

struct PixelBuffer {
    int width{0};
    int height{0};
    std::vector<std::uint8_t> rgba;  // width * height * 4, row-major

    static PixelBuffer blank(int w, int h, Color fill = {0, 0, 0, 0});

    bool empty() const { return width <= 0 || height <= 0; }
    int pitch() const { return width * 4; }
    Color at(int x, int y) const;
    void set(int x, int y, Color c);

    // Nearest-neighbour enlargement by an integer factor.
    PixelBuffer scaled(int factor) const;

    bool operator==(const PixelBuffer& o) const { return width == o.width && height == o.height && rgba == o.rgba; }
    bool operator!=(const PixelBuffer& o) const { return !(*this == o); }
};

}  // namespace Codex::Render
