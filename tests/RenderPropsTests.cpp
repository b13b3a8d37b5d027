// Painted walls, fences and wall traps choose their glyphs and colors from tags and parts.
#include <cassert>
#include <string>

#include "../game/ObjectCodex.h"
#include "SampleBlueprints.h"

using namespace Codex;
using namespace Codex::Props;
using Qud::ObjectCodex;

static const char* kPaintedXml = R"XML(<objects>
  <object Name="Object">
    <part Name="Render" DisplayName="[Object]" />
  </object>
  <object Name="RuinedWall" Inherits="Object">
    <part Name="Render" Tile="Tiles/placeholder.bmp" ColorString="&c^g" DetailColor="k" />
    <tag Name="PaintedWall" Value="Tiles/sw_wall_ruined,Tiles/sw_wall_ruined2" />
  </object>
  <object Name="PlainWall" Inherits="RuinedWall">
    <part Name="Render" DetailColor="y" />
    <tag Name="PaintedWall" Value="*delete" />
  </object>
  <object Name="Dirt" Inherits="Object">
    <part Name="Render" TileColor="&w^y" />
    <tag Name="PaintedWall" Value="Terrain/dirt" />
    <tag Name="PaintedWallAtlas" Value="Assets/" />
    <tag Name="PaintedWallExtension" Value=".png" />
  </object>
  <object Name="Mud" Inherits="Dirt" />
  <object Name="IronFence" Inherits="Object">
    <part Name="Render" ColorString="&y^r" TileColor="&Y^R" DetailColor="k" />
    <tag Name="PaintedFence" Value="Tiles/sw_fence" />
    <tag Name="PaintedWall" Value="Tiles/ignored" />
  </object>
  <object Name="DarkFence" Inherits="IronFence">
    <part Name="Render" TileColor="&Y^k" DetailColor="C" />
  </object>
  <object Name="Pipe" Inherits="Object">
    <part Name="Render" ColorString="&c" />
    <part Name="HydraulicPowerTransmission" TileEffects="true" TileAppendWhenPowered="_powered" TileAppendWhenUnbroken="_unbroken" />
    <tag Name="PaintedFence" Value="Tiles/sw_pipe" />
  </object>
  <object Name="FlameTrap" Inherits="Object">
    <part Name="Render" Tile="Walls/sw_trap.bmp" ColorString="&K" />
    <part Name="Walltrap" WarmColor="&R^W" />
  </object>
  <object Name="PlainTrap" Inherits="Object">
    <part Name="Render" Tile="Walls/sw_trap.bmp" />
    <part Name="Walltrap" />
  </object>
</objects>
)XML";

int main() {
    CodexTests::silenceLogs();
    CodexTests::MemoryGlyphSource glyphs;
    LoadError error;
    auto codex = ObjectCodex::load({{"Walls.xml", kPaintedXml}}, "", defaultConfig(), &glyphs, error);
    assert(codex);

    auto attributes = [&](const char* id) { return codex->renderAttributes(*codex->find(id)); };

    assert(!attributes("Object"));
    {
        // A black detail moves the secondary color into the background.
        auto wall = attributes("RuinedWall");
        assert(wall);
        assert(wall->glyph == "Tiles/sw_wall_ruined-00000000.bmp");
        assert(wall->color == "c");
        assert(wall->detail == "transparent");
        assert(wall->background == "g");
    }
    {
        // A deleted PaintedWall tag falls back to the Render tile.
        auto wall = attributes("PlainWall");
        assert(wall);
        assert(wall->glyph == "Tiles/placeholder.bmp");
        assert(wall->color == "c");
        assert(wall->detail == "y");
        assert(wall->background == "g");
    }
    {
        // Painted walls render without a Render Tile; atlas and extension tags are honored.
        auto dirt = attributes("Dirt");
        assert(dirt);
        assert(dirt->glyph == "Assets/Terrain/dirt-00000000.bmp");
        assert(dirt->color == "w");
        assert(dirt->detail.empty());
        assert(dirt->background == "y");
        auto mud = attributes("Mud");
        assert(mud && mud->glyph == "Assets/Terrain/dirt-00000000.png");
        assert(std::get<std::string>(*codex->resolve("Mud", "tile").value) == "Assets/Terrain/dirt-00000000.png");
    }
    {
        // Fences take priority over walls.
        auto fence = attributes("IronFence");
        assert(fence);
        assert(fence->glyph == "Tiles/sw_fence_nsew.bmp");
        assert(fence->color == "Y");
        assert(fence->detail == "transparent");
        assert(fence->background == "R");

        auto dark = attributes("DarkFence");
        assert(dark);
        assert(dark->color == "Y");
        assert(dark->detail == "C");
        assert(dark->background == "transparent");
    }
    {
        auto pipe = attributes("Pipe");
        assert(pipe);
        assert(pipe->glyph == "Tiles/sw_pipe_powered_unbroken_1_nsew.bmp");
        assert(pipe->color == "c");
        assert(pipe->background == "transparent");
    }
    {
        auto trap = attributes("FlameTrap");
        assert(trap);
        assert(trap->glyph == "Walls/sw_trap.bmp");
        assert(trap->color == "R");
        assert(trap->background == "W");
        assert(trap->detail == "transparent");

        auto plain = attributes("PlainTrap");
        assert(plain && plain->color == "r" && plain->background == "g");
    }
    return 0;
}
