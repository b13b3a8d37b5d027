#include "RenderProps.h"

#include <algorithm>
#include <cctype>
#include <utility>

#include "../../engine/markup/Cp437.h"
#include "ColorMarkup.h"

namespace Qud::Catalog {

using Codex::Props::FragmentTable;
using Codex::Render::OverlayLayer;
using Codex::Render::RenderAttributes;

static std::string valueOr(const FragmentTable& t, const char* kind, const char* name, const char* attr) {
    const std::string* v = t.value(kind, name, attr);
    return v ? *v : std::string();
}

static std::string attrOr(const Codex::Blueprints::Fragment& f, const char* attr) {
    const std::string* v = Codex::Blueprints::findAttribute(f.attributes, attr);
    return v ? *v : std::string();
}

// Value of a painting tag, or null when absent or deleted.
static const std::string* paintTag(const FragmentTable& t, const char* name) {
    const auto* f = t.find("tag", name);
    if (!f) return nullptr;
    const std::string* v = Codex::Blueprints::findAttribute(f->attributes, "Value");
    static const std::string kEmpty;
    if (!v) return &kEmpty;
    return *v == "*delete" ? nullptr : v;
}

static std::string tagValueOr(const FragmentTable& t, const char* name, const char* fallback) {
    const std::string v = valueOr(t, "tag", name, "Value");
    return v.empty() ? std::string(fallback) : v;
}

// "Tiles/Wall1,Tiles/Wall2" paints with the first entry.
static std::string paintPath(const std::string& value) { return value.substr(0, value.find(',')); }

static std::pair<std::string, std::string> splitBackground(const std::string& colorString) {
    const std::size_t caret = colorString.find('^');
    if (caret == std::string::npos) return {colorString, std::string()};
    return {colorString.substr(0, caret), colorString.substr(caret + 1, 1)};
}

bool hasTile(const FragmentTable& fragments) {
    if (fragments.find("tag", "BaseObject")) return false;
    const std::string* tile = fragments.value("part", "Render", "Tile");
    if (tile && !tile->empty()) return true;
    return paintTag(fragments, "PaintedFence") || paintTag(fragments, "PaintedWall");
}

namespace {

// Working colors while a tile is being painted; codes keep their "&"/"^" markup.
struct Paint {
    std::string color;
    std::string tileColor;
    std::string detail;
    std::string background;
};

void paintFence(const FragmentTable& t, const std::string& path, Paint& p, RenderAttributes& attrs) {
    if (p.tileColor.empty()) p.tileColor = p.color;
    if (p.tileColor.find('^') != std::string::npos) {
        auto [fore, back] = splitBackground(p.tileColor);
        p.tileColor = fore;
        if (foregroundCode(p.detail) == "k") {
            // A black detail means the secondary color is carried by the background.
            p.detail = "transparent";
            p.background = back;
        } else if (back != "k") {
            p.background = back;
        }
    }
    p.color = p.tileColor;

    std::string name = path;
    if (t.find("part", "HydraulicPowerTransmission") &&
        valueOr(t, "part", "HydraulicPowerTransmission", "TileEffects") == "true") {
        const std::string powered = valueOr(t, "part", "HydraulicPowerTransmission", "TileAppendWhenPowered");
        const std::string unbroken = valueOr(t, "part", "HydraulicPowerTransmission", "TileAppendWhenUnbroken");
        if (!powered.empty() && !unbroken.empty()) name += powered + unbroken;
        if (valueOr(t, "part", "HydraulicPowerTransmission", "TileAnimateSuppressWhenUnbroken").empty()) name += "_1";
    }
    if (t.find("part", "MechanicalPowerTransmission") &&
        valueOr(t, "part", "MechanicalPowerTransmission", "TileEffects") == "true") {
        name += "_1";
    }
    attrs.glyph = tagValueOr(t, "PaintedFenceAtlas", "Tiles/") + name + "_nsew" +
                  tagValueOr(t, "PaintedFenceExtension", ".bmp");
}

void paintWall(const FragmentTable& t, const std::string& path, const std::string& blueprint, Paint& p,
               RenderAttributes& attrs) {
    const std::string wallColor = p.tileColor.empty() ? p.color : p.tileColor;
    if (wallColor.find('^') != std::string::npos) {
        if (foregroundCode(p.detail) == "k") {
            p.detail = "transparent";
            p.background = splitBackground(wallColor).second;
        } else if (p.detail.empty()) {
            p.background = splitBackground(wallColor).second;
        }
    }
    const std::string extension = blueprint == "Dirt" ? std::string(".bmp") : tagValueOr(t, "PaintedWallExtension", ".bmp");
    attrs.glyph = tagValueOr(t, "PaintedWallAtlas", "Tiles/") + path + "-00000000" + extension;
}

// Wall traps are colored by the game at runtime from their warm color.
void paintWalltrap(const FragmentTable& t, Paint& p) {
    const std::string warm = valueOr(t, "part", "Walltrap", "WarmColor");
    std::string fore = foregroundCode(warm);
    std::string back = backgroundCode(warm);
    if (fore.empty()) fore = "r";
    if (back.empty()) back = "g";
    p.color = "&" + fore + "^" + back;
    p.tileColor = p.color;
    p.background = back;
    p.detail = "transparent";
}

}  // namespace

std::optional<RenderAttributes> renderAttributesFor(const FragmentTable& fragments, const std::string& blueprint) {
    if (!hasTile(fragments)) return std::nullopt;

    RenderAttributes attrs;
    attrs.glyph = valueOr(fragments, "part", "Render", "Tile");
    attrs.renderString = renderCharacter(fragments).value_or(std::string());

    Paint paint;
    paint.color = valueOr(fragments, "part", "Render", "ColorString");
    if (paint.color.empty()) paint.color = valueOr(fragments, "part", "Gas", "ColorString");
    paint.tileColor = valueOr(fragments, "part", "Render", "TileColor");
    paint.detail = valueOr(fragments, "part", "Render", "DetailColor");
    if (paint.tileColor.empty()) paint.background = backgroundCode(paint.color);

    // A fence takes priority over a wall.
    if (const std::string* fence = paintTag(fragments, "PaintedFence")) {
        paintFence(fragments, paintPath(*fence), paint, attrs);
    } else if (const std::string* wall = paintTag(fragments, "PaintedWall")) {
        paintWall(fragments, paintPath(*wall), blueprint, paint, attrs);
    } else if (fragments.find("part", "Walltrap")) {
        paintWalltrap(fragments, paint);
    }

    attrs.color = foregroundCode(paint.tileColor.empty() ? paint.color : paint.tileColor);
    attrs.detail = foregroundCode(paint.detail);
    attrs.background = paint.background.empty() ? "transparent" : paint.background;

    for (const auto* f : fragments.ofKind("overlay")) {
        OverlayLayer layer;
        layer.glyph = attrOr(*f, "Tile");
        if (layer.glyph.empty()) continue;
        layer.color = foregroundCode(attrOr(*f, "Color"));
        layer.detail = foregroundCode(attrOr(*f, "Detail"));
        attrs.overlays.push_back(std::move(layer));
    }
    return attrs;
}

std::optional<std::string> renderCharacter(const FragmentTable& fragments) {
    const std::string* rs = fragments.value("part", "Render", "RenderString");
    if (rs && rs->size() > 1 && rs->size() <= 3 &&
        std::all_of(rs->begin(), rs->end(), [](unsigned char c) { return std::isdigit(c); })) {
        const int code = std::stoi(*rs);
        if (code >= 0 && code <= 255) {
            std::string out;
            Codex::Markup::appendUtf8(out, Codex::Markup::cp437ToUnicode(static_cast<std::uint8_t>(code)));
            return out;
        }
    }
    if (fragments.find("part", "Gas")) return std::string("\xE2\x96\x93");  // ▓
    if (rs) return *rs;
    return std::nullopt;
}

}  // namespace Qud::Catalog
