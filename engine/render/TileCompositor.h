// Recolors glyph images with palette colors and stacks overlay layers into one tile.
#pragma once

#include <string>
#include <vector>

#include "../core/Config.h"
#include "../core/Diagnostics.h"
#include "GlyphSource.h"
#include "Palette.h"
#include "PixelBuffer.h"

namespace Codex::Render {

struct OverlayLayer {
    std::string glyph;
    std::string color;
    std::string detail;
};

struct RenderAttributes {
    std::string glyph;         // image path relative to the texture root
    std::string renderString;  // text-mode character
    std::string color;         // primary color code
    std::string detail;        // detail color code
    std::string background;    // color for fully transparent pixels
    std::vector<OverlayLayer> overlays;
};

class TileCompositor {
public:
    TileCompositor(GlyphSource& glyphs, const Palette& palette, const CodexConfig& config, DiagnosticLog& diagnostics)
        : glyphs_(glyphs), palette_(palette), config_(config), diagnostics_(diagnostics) {}

    // A missing base glyph yields a blank transparent tile of the configured size.
    PixelBuffer composite(const RenderAttributes& attrs, const std::string& blueprint = {}) const;
    // composite() enlarged by the configured big-tile scale.
    PixelBuffer compositeBig(const RenderAttributes& attrs, const std::string& blueprint = {}) const;

    // Black opaque -> tile, white opaque -> detail, alpha 0 -> background, anything else is
    // a mix of tile and detail weighted by its red channel.
    static void colorize(PixelBuffer& image, Color tile, Color detail, Color background);
    // Source-over blend of src onto dst, anchored at the top-left corner.
    static void blendOver(PixelBuffer& dst, const PixelBuffer& src);

private:
    std::optional<PixelBuffer> loadGlyph(const std::string& path, const std::string& blueprint) const;
    Color colorFor(const std::string& code, const char* fallbackCode, const std::string& blueprint) const;

    GlyphSource& glyphs_;
    const Palette& palette_;
    const CodexConfig& config_;
    DiagnosticLog& diagnostics_;
};

}  // namespace Codex::Render
