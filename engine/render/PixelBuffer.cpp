#include "PixelBuffer.h"

#include <algorithm>

namespace Codex::Render {

PixelBuffer PixelBuffer::blank(int w, int h, Color fill) {
    PixelBuffer buf;
    buf.width = std::max(w, 0);
    buf.height = std::max(h, 0);
    buf.rgba.resize(static_cast<std::size_t>(buf.width) * buf.height * 4);
    for (std::size_t i = 0; i < buf.rgba.size(); i += 4) {
        buf.rgba[i] = fill.r;
        buf.rgba[i + 1] = fill.g;
        buf.rgba[i + 2] = fill.b;
        buf.rgba[i + 3] = fill.a;
    }
    return buf;
}

Color PixelBuffer::at(int x, int y) const {
    const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 4;
    return Color{rgba[i], rgba[i + 1], rgba[i + 2], rgba[i + 3]};
}

void PixelBuffer::set(int x, int y, Color c) {
    const std::size_t i = (static_cast<std::size_t>(y) * width + x) * 4;
    rgba[i] = c.r;
    rgba[i + 1] = c.g;
    rgba[i + 2] = c.b;
    rgba[i + 3] = c.a;
}

PixelBuffer PixelBuffer::scaled(int factor) const {
    if (factor <= 1 || empty()) return *this;
    PixelBuffer out = blank(width * factor, height * factor);
    for (int y = 0; y < out.height; ++y) {
        for (int x = 0; x < out.width; ++x) {
            out.set(x, y, at(x / factor, y / factor));
        }
    }
    return out;
}

}  // namespace Codex::Render
