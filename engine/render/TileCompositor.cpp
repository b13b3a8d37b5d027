#include "TileCompositor.h"

#include <algorithm>
#include <cstdlib>

#include "../core/Logger.h"

namespace Codex::Render {

namespace {
constexpr Color kTileMarker{0, 0, 0, 255};
constexpr Color kDetailMarker{255, 255, 255, 255};

unsigned char mixChannel(int tile, int detail, int weight) {
    // |(tile - detail) * weight / 255 + min(tile, detail)|, truncated.
    const int numerator = (tile - detail) * weight + std::min(tile, detail) * 255;
    return static_cast<unsigned char>(std::abs(numerator) / 255);
}
}  // namespace

void TileCompositor::colorize(PixelBuffer& image, Color tile, Color detail, Color background) {
    for (int y = 0; y < image.height; ++y) {
        for (int x = 0; x < image.width; ++x) {
            const Color px = image.at(x, y);
            if (px == kTileMarker) {
                image.set(x, y, tile);
            } else if (px == kDetailMarker) {
                image.set(x, y, detail);
            } else if (px.a == 0) {
                image.set(x, y, background);
            } else {
                image.set(x, y,
                          Color{mixChannel(tile.r, detail.r, px.r), mixChannel(tile.g, detail.g, px.r),
                                mixChannel(tile.b, detail.b, px.r), 255});
            }
        }
    }
}

void TileCompositor::blendOver(PixelBuffer& dst, const PixelBuffer& src) {
    const int w = std::min(dst.width, src.width);
    const int h = std::min(dst.height, src.height);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            const Color s = src.at(x, y);
            if (s.a == 0) continue;
            if (s.a == 255) {
                dst.set(x, y, s);
                continue;
            }
            const Color d = dst.at(x, y);
            const int sa = s.a;
            const int da = d.a * (255 - sa) / 255;
            const int outA = sa + da;
            auto channel = [&](int sc, int dc) {
                return static_cast<unsigned char>((sc * sa + dc * da + outA / 2) / outA);
            };
            dst.set(x, y, Color{channel(s.r, d.r), channel(s.g, d.g), channel(s.b, d.b),
                                static_cast<unsigned char>(outA)});
        }
    }
}

Color TileCompositor::colorFor(const std::string& code, const char* fallbackCode, const std::string& blueprint) const {
    const Color fallback = palette_.find(fallbackCode).value_or(Color{});
    if (normalizeColorCode(code).empty()) return fallback;
    return palette_.resolve(code, fallback, &diagnostics_, blueprint);
}

std::optional<PixelBuffer> TileCompositor::loadGlyph(const std::string& path, const std::string& blueprint) const {
    if (path.empty()) {
        diagnostics_.add(Diagnostic{DiagnosticKind::MissingGlyph, blueprint, path, "no glyph declared"});
        return std::nullopt;
    }
    const std::string repaired = repairGlyphPath(path);
    auto image = glyphs_.load(repaired);
    if (!image || image->empty()) {
        diagnostics_.add(Diagnostic{DiagnosticKind::MissingGlyph, blueprint, repaired,
                                    "glyph image " + repaired + " not found"});
        return std::nullopt;
    }
    return image;
}

PixelBuffer TileCompositor::composite(const RenderAttributes& attrs, const std::string& blueprint) const {
    auto base = loadGlyph(attrs.glyph, blueprint);
    if (!base) {
        logWarn("Couldn't render tile for " + (blueprint.empty() ? attrs.glyph : blueprint) + ": using blank tile");
        return PixelBuffer::blank(config_.tileWidth, config_.tileHeight);
    }
    colorize(*base, colorFor(attrs.color, "y", blueprint), colorFor(attrs.detail, "transparent", blueprint),
             colorFor(attrs.background, "transparent", blueprint));

    const Color clear = colorFor("transparent", "transparent", blueprint);
    for (const auto& layer : attrs.overlays) {
        auto overlay = loadGlyph(layer.glyph, blueprint);
        if (!overlay) continue;
        colorize(*overlay, colorFor(layer.color, "y", blueprint), colorFor(layer.detail, "transparent", blueprint),
                 clear);
        blendOver(*base, *overlay);
    }
    return std::move(*base);
}

PixelBuffer TileCompositor::compositeBig(const RenderAttributes& attrs, const std::string& blueprint) const {
    return composite(attrs, blueprint).scaled(config_.bigTileScale);
}

}  // namespace Codex::Render
