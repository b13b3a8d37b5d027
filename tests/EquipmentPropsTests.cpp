// Mods, ammunition, powered equipment, food and creature traits from the property catalog.
#include <cassert>
#include <string>

#include "../game/ObjectCodex.h"
#include "SampleBlueprints.h"

using namespace Codex;
using namespace Codex::Props;
using Qud::ObjectCodex;

static const char* kEquipmentXml = R"XML(<objects>
  <object Name="Object">
    <part Name="Render" DisplayName="[Object]" />
  </object>
  <object Name="Item" Inherits="Object">
    <part Name="Physics" Weight="1" />
  </object>
  <object Name="MeleeWeapon" Inherits="Item">
    <part Name="MeleeWeapon" BaseDamage="1d4" />
  </object>
  <object Name="MissileWeapon" Inherits="Item">
    <part Name="MissileWeapon" ShotsPerAction="1" />
  </object>
  <object Name="Projectile" Inherits="Object" />
  <object Name="Svensword" Inherits="MeleeWeapon">
    <part Name="AddMod" Mods="ModCounterweighted,ModElectrified" Tiers="5,7" />
    <part Name="Examiner" Complexity="2" />
    <part Name="VibroWeapon" ChargeUse="0" />
  </object>
  <object Name="FlamingAxe" Inherits="MeleeWeapon">
    <part Name="ModFlaming" Tier="5" />
    <part Name="ModMasterwork" />
  </object>
  <object Name="ShockStaff" Inherits="MeleeWeapon">
    <part Name="ModElectrified" Tier="4" />
  </object>
  <object Name="PrayerRod" Inherits="MeleeWeapon">
    <part Name="StunOnHit" ChargeUse="5" />
    <part Name="Gaslight" ChargeUse="5" UnchargedDamage="1d4" />
  </object>
  <object Name="GlassPlate" Inherits="Item">
    <part Name="ModGlassArmor" Tier="3" />
  </object>
  <object Name="Trinket" Inherits="Item">
    <part Name="TinkerItem" Bits="1" CanBuild="true" />
  </object>
  <object Name="Disk" Inherits="Item">
    <part Name="ThrownWeapon" Damage="1d6" />
    <part Name="GeomagneticDisk" Damage="2d6" />
  </object>
  <object Name="ProjectilePump" Inherits="Projectile">
    <part Name="Projectile" Attributes="Poison Gas" PenetrateCreatures="true" />
    <part Name="GasOnHit" Blueprint="PoisonGas" />
    <part Name="TemperatureOnHit" Amount="-50" MaxTemp="10" />
  </object>
  <object Name="Pump" Inherits="MissileWeapon">
    <part Name="MagazineAmmoLoader" AmmoPart="AmmoDart" ProjectileObject="ProjectilePump" />
  </object>
  <object Name="Sprayer" Inherits="MissileWeapon">
    <part Name="LiquidAmmoLoader" Liquid="water" />
    <part Name="CooldownAmmoLoader" Cooldown="1d4" />
  </object>
  <object Name="Blaster" Inherits="MissileWeapon">
    <part Name="EnergyAmmoLoader" ChargeUse="10" />
    <part Name="EnergyCellSocket" SlotType="EnergyCell" />
  </object>
  <object Name="Lamp" Inherits="Item">
    <part Name="Physics" FlameTemperature="350" />
    <part Name="LightSource" Radius="4" />
    <part Name="SaveModifier" Vs="Fear" Amount="2" IsEMPSensitive="true" />
    <part Name="MoveCostMultiplier" Amount="-10" />
    <part Name="AddsRep" Faction="Fungi:200,Consortium:-200" />
    <part Name="NoKnockdown" />
    <part Name="Spectacles" />
    <part Name="DestroyOnUnequip" />
    <part Name="Book" ID="Lamplight" />
  </object>
  <object Name="DimLamp" Inherits="Lamp" />
  <object Name="Charm" Inherits="Item">
    <part Name="AddsRep" Faction="Apes,Goatfolk" Value="-100" />
  </object>
  <object Name="Still" Inherits="Item">
    <part Name="LiquidProducer" Rate="20" Liquid="oil" IsEMPSensitive="false" />
    <part Name="LiquidBurst" Liquid="acid" />
    <part Name="LiquidFueledEnergyCell" ChargePerDram="10" />
  </object>
  <object Name="Witchwood" Inherits="Item">
    <part Name="Food" Healing="1d16+24" Satiation="Snack" Thirst="5" Message="Tangy." IllOnEat="true" />
    <part Name="BreatheOnEat" Class="FireBreather" Level="5" />
    <part Name="PreparedCookingIngredient" type="heat,cold" />
    <part Name="PreservableItem" Result="PickledBark" Number="3" />
    <tag Name="Plant" />
    <tag Name="ChooseToPreserve" />
    <intproperty Name="Currency" Value="1" />
  </object>
  <object Name="Corpse" Inherits="Item">
    <part Name="Food" IllOnEat="true" />
  </object>
  <object Name="BeastCorpse" Inherits="Corpse">
    <part Name="Butcherable" OnSuccess="Raw Meat" />
    <tag Name="Meat" />
  </object>
  <object Name="Creature" Inherits="Object">
    <part Name="Brain" Factions="Beasts-100" />
  </object>
  <object Name="Glowfish" Inherits="Creature">
    <part Name="Brain" Aquatic="true" />
    <part Name="Swarmer" ExtraBonus="2" />
    <xtagWaterRitual SellSkill="Swimming" />
  </object>
  <object Name="Glowfry" Inherits="Glowfish" />
  <object Name="Wall" Inherits="Object">
    <part Name="Render" Occluding="true" />
  </object>
  <object Name="LowWall" Inherits="Wall">
    <tag Name="Flyover" />
  </object>
</objects>
)XML";

int main() {
    CodexTests::silenceLogs();
    CodexTests::MemoryGlyphSource glyphs;
    LoadError error;
    auto codex = ObjectCodex::load({{"Equipment.xml", kEquipmentXml}}, "", defaultConfig(), &glyphs, error);
    assert(codex);

    auto value = [&](const char* id, const char* property) {
        PropertyResult r = codex->resolve(id, property);
        assert(r.ok() && r.value);
        return *r.value;
    };
    auto text = [&](const char* id, const char* property) { return std::get<std::string>(value(id, property)); };
    auto number = [&](const char* id, const char* property) { return std::get<int>(value(id, property)); };
    auto yes = [&](const char* id, const char* property) { return std::get<bool>(value(id, property)); };
    auto absent = [&](const char* id, const char* property) {
        return codex->resolve(id, property).status == PropertyStatus::Absent;
    };

    {
        // AddMod entries carry their tiers; Mod parts default to tier 1.
        const auto mods = std::get<NamedValueList>(value("Svensword", "mods"));
        assert(mods.size() == 2);
        assert(mods[0].first == "ModCounterweighted" && mods[0].second == 5);
        assert(mods[1].first == "ModElectrified" && mods[1].second == 7);
        assert(number("Svensword", "modcount") == 2);
        // 2 + Counterweighted 1 + Electrified 1.
        assert(number("Svensword", "complexity") == 4);

        const auto axe = std::get<NamedValueList>(value("FlamingAxe", "mods"));
        assert(axe.size() == 2);
        assert(axe[0].first == "ModFlaming" && axe[0].second == 5);
        assert(axe[1].first == "ModMasterwork" && axe[1].second == 1);
        // Masterwork only adds to an item that Flaming has already made complex.
        assert(number("FlamingAxe", "complexity") == 2);
        assert(absent("MeleeWeapon", "mods"));
        assert(absent("MeleeWeapon", "modcount"));

        assert(number("GlassPlate", "reflect") == 3);
        assert(absent("GlassPlate", "complexity"));
        assert(number("Trinket", "complexity") == 0);
    }
    {
        assert(text("FlamingAxe", "elementaldamage") == "4-6");
        assert(text("FlamingAxe", "elementaltype") == "Fire");
        assert(text("ShockStaff", "elementaldamage") == "4-6");
        assert(text("ShockStaff", "elementaltype") == "Electric");
        // A mod added through AddMod is not a declared part.
        assert(absent("Svensword", "elementaldamage"));
        assert(yes("FlamingAxe", "empsensitive"));
        assert(absent("Svensword", "empsensitive"));
    }
    {
        assert(yes("Svensword", "vibro"));
        assert(!yes("FlamingAxe", "vibro"));
        assert(yes("Disk", "vibro"));
        assert(absent("Lamp", "vibro"));
        // A vibro blade that draws no charge is not powered.
        assert(absent("Svensword", "pvpowered"));
        assert(yes("PrayerRod", "pvpowered"));
        assert(text("PrayerRod", "chargefunction") == "Stun effect, weapon power");
        assert(text("PrayerRod", "unpowereddamage") == "1d4");
        assert(text("Disk", "chargefunction") == "Disc effect");
        assert(absent("Svensword", "chargefunction"));
    }
    {
        // Ammunition facts come from the loaded projectile.
        assert(text("Pump", "ammo") == "dart");
        assert((std::get<StringList>(value("Pump", "ammodamagetypes")) == StringList{"Poison", "Gas"}));
        assert(text("Pump", "gasemitted") == "PoisonGas");
        assert(yes("Pump", "penetratingammo"));
        assert(text("Pump", "temponhit") == "-50");
        assert(number("Pump", "temponhitmax") == 10);
        assert(absent("Pump", "temponenter"));

        assert(text("Sprayer", "ammo") == "water");
        assert(number("Sprayer", "dramsperuse") == 1);
        assert(text("Sprayer", "shotcooldown") == "1d4");
        assert(absent("Sprayer", "penetratingammo"));

        assert(text("Blaster", "ammo") == "energy");
        assert(yes("Blaster", "energycellrequired"));
        assert(yes("Blaster", "empsensitive"));
        assert(text("Blaster", "chargefunction") == "Weapon power");
    }
    {
        assert(number("Lamp", "lightradius") == 4);
        assert(number("DimLamp", "lightradius") == 4);
        assert(number("Lamp", "flametemperature") == 350);
        // Only an item that declares Physics itself reports a flame temperature.
        assert(absent("DimLamp", "flametemperature"));
        assert(text("Lamp", "savemodifier") == "Fear");
        assert(number("Lamp", "savemodifieramt") == 2);
        assert(yes("Lamp", "empsensitive"));
        assert(number("Lamp", "movespeedbonus") == 10);
        assert(yes("Lamp", "noprone") && yes("Lamp", "spectacles") && yes("Lamp", "destroyonunequip"));
        assert(text("Lamp", "bookid") == "Lamplight");

        const auto reps = std::get<NamedValueList>(value("Lamp", "reputationbonus"));
        assert(reps.size() == 2);
        assert(reps[0].first == "Fungi" && reps[0].second == 200);
        assert(reps[1].first == "Consortium" && reps[1].second == -200);
        const auto shared = std::get<NamedValueList>(value("Charm", "reputationbonus"));
        assert(shared.size() == 2);
        assert(shared[1].first == "Goatfolk" && shared[1].second == -100);
    }
    {
        assert(number("Still", "liquidgen") == 20);
        assert(text("Still", "liquidtype") == "oil");
        assert(text("Still", "liquidburst") == "acid");
        assert(number("Still", "chargeperdram") == 10);
        assert(absent("Still", "empsensitive"));
    }
    {
        assert(text("Witchwood", "healing") == "1d16+24");
        assert(text("Witchwood", "hunger") == "Snack");
        assert(number("Witchwood", "thirst") == 5);
        assert(text("Witchwood", "eatdesc") == "Tangy.");
        assert(yes("Witchwood", "illoneat"));
        assert(std::get<StringList>(value("Witchwood", "oneat")) == StringList{"BreatheOnEatFireBreather5"});
        assert((std::get<StringList>(value("Witchwood", "cookeffect")) == StringList{"heat", "cold"}));
        assert(text("Witchwood", "preservedinto") == "PickledBark");
        assert(number("Witchwood", "preservedquantity") == 3);
        assert(yes("Witchwood", "isplant"));
        assert(yes("Witchwood", "exoticfood"));
        assert(yes("Witchwood", "iscurrency"));
        assert(absent("Witchwood", "isfungus"));

        // Corpses are expected to sicken and do not report it.
        assert(absent("BeastCorpse", "illoneat"));
        assert(text("BeastCorpse", "butcheredinto") == "Raw Meat");
        assert(yes("BeastCorpse", "ismeat"));
        assert(absent("BeastCorpse", "harvestedinto"));
    }
    {
        assert(yes("Glowfish", "isswarmer"));
        assert(number("Glowfish", "swarmbonus") == 2);
        assert(yes("Glowfish", "aquatic"));
        assert(yes("Glowfish", "waterritualable"));
        // Swarming and water rituals belong to the declaring blueprint.
        assert(absent("Glowfry", "isswarmer"));
        assert(absent("Glowfry", "waterritualable"));
        assert(yes("Glowfry", "aquatic"));
        assert(absent("Creature", "aquatic"));

        assert(yes("Wall", "isoccluding"));
        assert(!yes("Wall", "flyover"));
        assert(yes("LowWall", "flyover"));
        assert(absent("Lamp", "flyover"));
    }
    assert(codex->diagnostics().count(DiagnosticKind::PropertyType) == 0);
    return 0;
}
