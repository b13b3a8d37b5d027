// Small blueprint set shared by the resolver, catalog and codex tests.
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "../engine/core/Logger.h"
#include "../engine/render/GlyphSource.h"

namespace CodexTests {

inline constexpr std::string_view kObjectsXml = R"XML(<?xml version="1.0" encoding="utf-8"?>
<objects>
  <object Name="Object">
    <part Name="Physics" Weight="0" Solid="false" />
    <part Name="Render" DisplayName="[Object]" RenderString="?" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="PhysicalObject" Inherits="Object">
    <part Name="Render" ColorString="&y" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="Item" Inherits="PhysicalObject">
    <part Name="Physics" Weight="1" />
    <part Name="Commerce" Value="1" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="MeleeWeapon" Inherits="Item">
    <part Name="MeleeWeapon" BaseDamage="1d2" Skill="Cudgel" PenBonus="1" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="BaseLongBlade" Inherits="MeleeWeapon">
    <part Name="MeleeWeapon" Skill="LongBlades" MaxStrengthBonus="3" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="IronSword" Inherits="BaseLongBlade">
    <part Name="Render" DisplayName="{{c|iron}} long sword" Tile="Items/sw_longsword.bmp" RenderString="47" TileColor="&c" DetailColor="C" />
    <part Name="Physics" Weight="5" />
    <part Name="Commerce" Value="12.5" />
    <part Name="TinkerItem" Bits="1B3" CanBuild="true" />
  </object>
  <object Name="Creature" Inherits="PhysicalObject">
    <part Name="Brain" Factions="Beasts-100" />
    <part Name="Corpse" CorpseBlueprint="Generic Corpse" CorpseChance="0" />
    <stat Name="Hitpoints" Value="10" />
    <stat Name="Level" Value="1" />
    <stat Name="AV" Value="0" />
    <stat Name="DV" Value="0" />
    <stat Name="MA" Value="0" />
    <stat Name="Strength" sValue="16" />
    <stat Name="Agility" sValue="16" />
    <stat Name="Willpower" Value="16" />
    <tag Name="Animal" />
    <tag Name="BaseObject" Value="*noinherit" />
  </object>
  <object Name="Snapjaw" Inherits="Creature">
    <part Name="Render" DisplayName="snapjaw scavenger" Tile="Creatures/sw_snapjaw.bmp" ColorString="&w^k" DetailColor="W" />
    <part Name="Description" Short="=Pronouns.Subjective= =verb:are= hungry and =verb:bare= =pronouns.possessive= teeth." />
    <part Name="Brain" Factions="Snapjaws-100,Joppa--50" />
    <part Name="Corpse" CorpseBlueprint="Snapjaw Corpse" CorpseChance="40" />
    <stat Name="Hitpoints" Value="15" />
    <stat Name="Level" Value="5" />
    <stat Name="Strength" sValue="16,1d3,(t-1)d2" />
    <stat Name="Agility" sValue="18" />
    <stat Name="Willpower" Value="12" />
    <skill Name="Acrobatics_Dodge" />
    <inventoryobject Blueprint="IronSword" Number="1" />
    <inventoryobject Blueprint="*Junk 1" />
    <tag Name="Gender" Value="male" />
  </object>
  <object Name="SnapjawHunter" Inherits="Snapjaw">
    <part Name="Render" DisplayName="snapjaw hunter" />
    <part Name="Brain" Factions="*append:Hunters-50" />
    <removepart Name="Corpse" />
    <tag Name="Gender" Value="female" />
  </object>
  <object Name="SnapjawCultist" Inherits="Snapjaw">
    <tag Name="Gender" Value="*delete" />
  </object>
  <object Name="BrokenCreature" Inherits="Creature">
    <stat Name="AV" Value="lots" />
  </object>
  <object Name="Oddity" Inherits="PhysicalObject">
    <part Name="Description" Short="=pronouns.weird= stares at =subject.name=." />
  </object>
</objects>
)XML";

// Glyphs served from memory so tests need no texture directory.
class MemoryGlyphSource : public Codex::Render::GlyphSource {
public:
    std::optional<Codex::Render::PixelBuffer> load(const std::string& path) override {
        ++loads;
        auto it = images.find(path);
        if (it == images.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, Codex::Render::PixelBuffer> images;
    int loads{0};
};

// Four pixels: tile marker, detail marker, transparent, and a half-red mix.
inline Codex::Render::PixelBuffer markerGlyph() {
    using Codex::Render::Color;
    Codex::Render::PixelBuffer img = Codex::Render::PixelBuffer::blank(2, 2);
    img.set(0, 0, Color{0, 0, 0, 255});
    img.set(1, 0, Color{255, 255, 255, 255});
    img.set(0, 1, Color{0, 0, 0, 0});
    img.set(1, 1, Color{128, 0, 0, 255});
    return img;
}

// Keeps test output readable; assertions carry the signal.
inline void silenceLogs() {
    Codex::Logger::setSink([](Codex::LogLevel, std::string_view) {});
}

}  // namespace CodexTests
