#include "ObjectProps.h"

#include <cctype>
#include <optional>
#include <string>
#include <utility>

#include "../../engine/blueprint/BlueprintTree.h"
#include "../../engine/props/PropertyResolver.h"
#include "ColorMarkup.h"
#include "DiceBag.h"
#include "RenderProps.h"
#include "SValue.h"

namespace Qud::Catalog {

using Codex::Props::ComputeFn;
using Codex::Props::NamedValueList;
using Codex::Props::PropertyContext;
using Codex::Props::PropertyDef;
using Codex::Props::PropertyRegistry;
using Codex::Props::PropertyResult;
using Codex::Props::PropertyValue;
using Codex::Props::StringList;
using Codex::Props::ValueType;

using MaybeValue = std::optional<PropertyValue>;

// ---- helpers --------------------------------------------------------------

static bool isActive(const PropertyContext& ctx) {
    for (const char* id : kActiveCharacters) {
        if (ctx.inheritsFrom(id)) return true;
    }
    return false;
}

static bool isInactive(const PropertyContext& ctx) {
    for (const char* id : kInactiveCharacters) {
        if (ctx.inheritsFrom(id)) return true;
    }
    return false;
}

static bool isCharacter(const PropertyContext& ctx) { return isActive(ctx) || isInactive(ctx); }

static MaybeValue text(const std::string* v) {
    if (!v) return std::nullopt;
    return PropertyValue{*v};
}

static MaybeValue number(std::optional<int> v) {
    if (!v) return std::nullopt;
    return PropertyValue{*v};
}

static MaybeValue flag(bool present) {
    if (!present) return std::nullopt;
    return PropertyValue{true};
}

static bool isTrue(const std::string* v) {
    return v && (*v == "true" || *v == "True");
}

static int floorDiv(int a, int b) {
    int q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

static std::optional<std::string> textProperty(PropertyContext& ctx, const std::string& name) {
    auto v = ctx.property(name);
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&*v)) return *s;
    return std::nullopt;
}

static std::optional<int> intOf(const PropertyResult& r) {
    if (!r.ok() || !r.value) return std::nullopt;
    if (const auto* i = std::get_if<int>(&*r.value)) return *i;
    return std::nullopt;
}

static std::optional<int> level(PropertyContext& ctx) {
    auto lv = textProperty(ctx, "lv");
    if (!lv) return std::nullopt;
    auto parsed = parseLevel(*lv);
    if (!parsed) ctx.typeError("level '" + *lv + "' is not a number");
    return parsed;
}

// Strength, Agility, ... as a dice string: creatures roll sValues, armor grants a bonus.
static std::optional<std::string> attributeString(PropertyContext& ctx, const std::string& attr) {
    if (isActive(ctx)) {
        std::optional<std::string> val;
        if (const std::string* sv = ctx.raw("stat", attr, "sValue"); sv && !sv->empty()) {
            std::string error;
            auto parsed = SValue::parse(*sv, level(ctx).value_or(1), &error);
            if (!parsed) {
                ctx.typeError("stat." + attr + ".sValue: " + error);
                return std::nullopt;
            }
            val = parsed->diceString();
        } else if (const std::string* v = ctx.raw("stat", attr, "Value"); v && !v->empty()) {
            val = *v;
        }
        if (const std::string* boost = ctx.raw("stat", attr, "Boost"); val && boost && !boost->empty()) {
            *val += "+" + *boost;
        }
        return val;
    }
    if (ctx.inheritsFrom("Armor")) {
        if (const std::string* v = ctx.raw("part", "Armor", attr)) return *v;
    }
    return std::nullopt;
}

static std::optional<int> attributeAverage(PropertyContext& ctx, const std::string& attr) {
    auto dice = textProperty(ctx, [&] {
        std::string lowered = attr;
        for (char& c : lowered) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return lowered;
    }());
    if (!dice) return std::nullopt;
    std::string error;
    auto bag = DiceBag::parse(*dice, &error);
    if (!bag) {
        ctx.typeError(attr + " '" + *dice + "': " + error);
        return std::nullopt;
    }
    double avg = bag->average();
    // Minions lose 20% of every stat.
    if (textProperty(ctx, "role").value_or(std::string()) == "Minion") avg *= 0.8;
    return static_cast<int>(avg);
}

static std::optional<int> attributeModifier(PropertyContext& ctx, const std::string& attr) {
    auto avg = attributeAverage(ctx, attr);
    if (!avg) return std::nullopt;
    return floorDiv(*avg - 16, 2);
}

static std::optional<int> resistance(PropertyContext& ctx, const std::string& element) {
    if (ctx.has("part", "Armor")) {
        return ctx.integer("part", "Armor", element == "Electric" ? "Elec" : element);
    }
    return ctx.integer("stat", element + "Resistance", "Value");
}

static bool isInventoryPlaceholder(const std::string& name) {
    return name.empty() || name[0] == '*' || name[0] == '#' || name[0] == '@';
}

// Sums an integer property over the blueprints a character starts with.
static int inventorySum(PropertyContext& ctx, const std::string& property) {
    int total = 0;
    for (const auto* f : ctx.fragments().ofKind("inventoryobject")) {
        if (isInventoryPlaceholder(f->name)) continue;
        const auto* item = ctx.lookup(f->name);
        if (!item) continue;
        total += intOf(ctx.resolveOn(*item, property)).value_or(0);
    }
    return total;
}

// The projectile a missile weapon or arrow fires, if its loader names one.
static const Codex::Blueprints::BlueprintNode* projectileObject(PropertyContext& ctx) {
    if (!ctx.has("part", "MissileWeapon") && !ctx.isSpecified("part", "AmmoArrow")) return nullptr;
    static const char* kLoaders[] = {"BioAmmoLoader", "AmmoArrow", "MagazineAmmoLoader", "EnergyAmmoLoader",
                                     "LiquidAmmoLoader"};
    for (const char* loader : kLoaders) {
        const std::string* id = ctx.raw("part", loader, "ProjectileObject");
        if (id && !id->empty()) return ctx.lookup(*id);
    }
    return nullptr;
}

static std::optional<std::string> projectileAttribute(PropertyContext& ctx, const std::string& path) {
    const auto* projectile = projectileObject(ctx);
    if (!projectile) return std::nullopt;
    PropertyResult r = ctx.resolveOn(*projectile, path);
    if (!r.ok() || !r.value) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&*r.value)) return *s;
    return std::nullopt;
}

static bool meleeWeapon(const PropertyContext& ctx) {
    return ctx.inheritsFrom("MeleeWeapon") || ctx.isSpecified("part", "MeleeWeapon");
}

static void add(PropertyRegistry& registry,
                const char* name,
                ValueType type,
                const char* summary,
                ComputeFn compute,
                std::optional<PropertyValue> fallback = std::nullopt) {
    registry.add(PropertyDef{name, type, std::move(compute), std::move(fallback), summary});
}

// ---- identity and text ----------------------------------------------------

static void registerIdentity(PropertyRegistry& r) {
    add(r, "id", ValueType::Text, "Blueprint name.", [](PropertyContext& ctx) -> MaybeValue {
        return PropertyValue{ctx.id()};
    });
    add(r, "inheritingfrom", ValueType::Text, "Parent blueprint; absent on the root.",
        [](PropertyContext& ctx) -> MaybeValue {
            const auto* parent = ctx.node().parent();
            if (!parent) return std::nullopt;
            return PropertyValue{parent->id()};
        });
    add(r, "inheritancepath", ValueType::Text, "Root-to-node chain joined with arrows.",
        [](PropertyContext& ctx) -> MaybeValue {
            return PropertyValue{Codex::Blueprints::BlueprintTree::inheritancePath(ctx.node())};
        });
    add(
        r, "displayname", ValueType::Text, "Render DisplayName without color markup.",
        [](PropertyContext& ctx) -> MaybeValue {
            const std::string* name = ctx.raw("part", "Render", "DisplayName");
            if (!name) return std::nullopt;
            return PropertyValue{stripColors(*name)};
        },
        PropertyValue{std::string()});
    add(r, "title", ValueType::Text, "Display name with color markup, else the blueprint name.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (const std::string* forced = ctx.raw("builder", "GoatfolkHero1", "ForceName")) {
                return PropertyValue{*forced};
            }
            if (const std::string* name = ctx.raw("part", "Render", "DisplayName"); name && !name->empty()) {
                return PropertyValue{*name};
            }
            return PropertyValue{ctx.id()};
        });
    add(r, "desc", ValueType::Text, "Short description with pronoun and verb placeholders filled.",
        [](PropertyContext& ctx) -> MaybeValue {
            std::string desc;
            const std::string* shortDesc = ctx.raw("part", "Description", "Short");
            if (shortDesc && *shortDesc == "A hideous specimen.") return std::nullopt;
            if (ctx.has("intproperty", "GenotypeBasedDescription")) {
                const std::string* trueKin = ctx.raw("property", "TrueManDescription", "Value");
                const std::string* mutant = ctx.raw("property", "MutantDescription", "Value");
                desc = "[True kin]\n" + (trueKin ? *trueKin : std::string()) + "\n\n[Mutant]\n" +
                       (mutant ? *mutant : std::string());
            } else if (shortDesc && !shortDesc->empty()) {
                desc = *shortDesc;
                if (const std::string* mark = ctx.raw("part", "Description", "Mark"); mark && !mark->empty()) {
                    desc += "\n\n" + *mark;
                }
            } else {
                return std::nullopt;
            }
            if (const std::string* postfix = ctx.raw("part", "BonusPostfix", "Postfix")) desc += "\n\n" + *postfix;
            return PropertyValue{ctx.substitute(desc)};
        });
    add(r, "description", ValueType::Text, "Long-form name for desc.", [](PropertyContext& ctx) -> MaybeValue {
        return ctx.property("desc");
    });
    add(r, "gender", ValueType::Text, "Gender tag of a character.", [](PropertyContext& ctx) -> MaybeValue {
        if (!isActive(ctx)) return std::nullopt;
        return text(ctx.raw("tag", "Gender", "Value"));
    });
    add(r, "pronouns", ValueType::Text, "Pronoun set of a creature.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFrom("Creature")) return std::nullopt;
        return text(ctx.raw("tag", "PronounSet", "Value"));
    });
    add(r, "role", ValueType::Text, "Assigned role, e.g. Minion or Brute.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("property", "Role", "Value"));
    });
    add(r, "demeanor", ValueType::Text, "docile, aggressive or neutral.", [](PropertyContext& ctx) -> MaybeValue {
        if (!isActive(ctx)) return std::nullopt;
        auto lowerIs = [](const std::string* v, const char* expected) {
            if (!v) return false;
            std::string l = *v;
            for (char& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return l == expected;
        };
        if (const std::string* calm = ctx.raw("part", "Brain", "Calm")) {
            return PropertyValue{std::string(lowerIs(calm, "true") ? "docile" : "neutral")};
        }
        if (const std::string* hostile = ctx.raw("part", "Brain", "Hostile")) {
            return PropertyValue{std::string(lowerIs(hostile, "true") ? "aggressive" : "neutral")};
        }
        return std::nullopt;
    });
}

// ---- character stats ------------------------------------------------------

static void registerStats(PropertyRegistry& r) {
    add(r, "lv", ValueType::Text, "Level; may be a range such as 18-29.", [](PropertyContext& ctx) -> MaybeValue {
        if (const std::string* sv = ctx.raw("stat", "Level", "sValue")) return PropertyValue{*sv};
        return text(ctx.raw("stat", "Level", "Value"));
    });
    add(r, "hp", ValueType::Text, "Hitpoints of a character.", [](PropertyContext& ctx) -> MaybeValue {
        if (!isCharacter(ctx)) return std::nullopt;
        if (const std::string* sv = ctx.raw("stat", "Hitpoints", "sValue")) return PropertyValue{*sv};
        return text(ctx.raw("stat", "Hitpoints", "Value"));
    });

    static const char* kAttributes[] = {"Strength", "Agility", "Toughness", "Intelligence", "Willpower", "Ego"};
    for (const char* attr : kAttributes) {
        std::string name = attr;
        for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const std::string attribute = attr;
        add(r, name.c_str(), ValueType::Text, "Attribute as a dice string.",
            [attribute](PropertyContext& ctx) -> MaybeValue {
                auto v = attributeString(ctx, attribute);
                if (!v) return std::nullopt;
                return PropertyValue{*v};
            });
    }

    add(r, "av", ValueType::Int, "Armor value of armor, shields and characters.",
        [](PropertyContext& ctx) -> MaybeValue {
            std::optional<int> av = ctx.integer("part", "Armor", "AV");
            if (auto shield = ctx.integer("part", "Shield", "AV")) av = shield;
            if (isCharacter(ctx)) {
                av = ctx.integer("stat", "AV", "Value").value_or(0) + inventorySum(ctx, "av");
            }
            return number(av);
        });
    add(r, "dv", ValueType::Int, "Dodge value: armor modifier, or 6 + DV + Agility modifier for creatures.",
        [](PropertyContext& ctx) -> MaybeValue {
            std::optional<int> dv;
            if (ctx.inheritsFrom("Armor")) dv = ctx.integer("part", "Armor", "DV");
            if (ctx.inheritsFrom("Shield")) {
                if (auto shield = ctx.integer("part", "Shield", "DV")) dv = shield;
            } else if (isInactive(ctx)) {
                dv = -10;
            } else if (isActive(ctx)) {
                // Only an immobility the blueprint declares itself pins DV.
                const std::string* mobile = ctx.raw("part", "Brain", "Mobile");
                if (ctx.isSpecified("part", "Brain", "Mobile") && mobile && (*mobile == "false" || *mobile == "False")) {
                    return PropertyValue{-10};
                }
                int value = 6 + ctx.integer("stat", "DV", "Value").value_or(0);
                if (ctx.has("skill", "Acrobatics_Dodge")) value += 2;
                if (ctx.has("skill", "Acrobatics_Tumble")) value += 1;
                value += attributeModifier(ctx, "Agility").value_or(0);
                value += inventorySum(ctx, "dv");
                if (const auto* carapace = ctx.fragments().find("mutation", "Carapace")) {
                    const std::string* lvl = Codex::Blueprints::findAttribute(carapace->attributes, "Level");
                    const int level = (lvl ? ctx.toInt(*lvl, "mutation.Carapace.Level").value_or(0) : 0) + 1;
                    value -= 7 - level / 2;
                }
                dv = value;
            }
            return number(dv);
        });
    add(r, "ma", ValueType::Int, "Mental armor: 4 + MA + Willpower modifier for creatures.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (ctx.has("part", "MentalShield")) return std::nullopt;
            if (isInactive(ctx)) return PropertyValue{0};
            if (!isActive(ctx)) return std::nullopt;
            int ma = 4 + ctx.integer("stat", "MA", "Value").value_or(0);
            ma += attributeModifier(ctx, "Willpower").value_or(0);
            return PropertyValue{ma};
        });
    add(r, "quickness", ValueType::Int, "Speed of a creature.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFrom("Creature")) return std::nullopt;
        return number(ctx.integer("stat", "Speed", "Value"));
    });
    add(r, "movespeed", ValueType::Int, "Move speed of a creature.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFrom("Creature")) return std::nullopt;
        return number(ctx.integer("stat", "MoveSpeed", "Value"));
    });
    add(r, "tier", ValueType::Int, "Declared tier, else the top tinker bit, else level / 5.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.isSpecified("tag", "Tier", "Value")) {
                if (ctx.isSpecified("part", "TinkerItem", "Bits")) {
                    const std::string* bits = ctx.raw("part", "TinkerItem", "Bits");
                    if (bits && !bits->empty() && std::isdigit(static_cast<unsigned char>(bits->back()))) {
                        return PropertyValue{bits->back() - '0'};
                    }
                    return PropertyValue{0};
                }
                if (auto lv = level(ctx)) return PropertyValue{floorDiv(*lv, 5)};
            }
            return number(ctx.integer("tag", "Tier", "Value"));
        });

    static const char* kElements[] = {"Acid", "Cold", "Heat", "Electric"};
    for (const char* element : kElements) {
        std::string name = element;
        for (char& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const std::string el = element;
        add(r, name.c_str(), ValueType::Int, "Elemental resistance of equipment or characters.",
            [el](PropertyContext& ctx) -> MaybeValue { return number(resistance(ctx, el)); });
    }

    add(r, "faction", ValueType::NamedList, "Brain factions with loyalty values.",
        [](PropertyContext& ctx) -> MaybeValue {
            const std::string* factions = ctx.raw("part", "Brain", "Factions");
            if (!factions || factions->empty()) return std::nullopt;
            NamedValueList out;
            for (const auto& entry : Codex::Props::splitList(*factions)) {
                // "Joppa-100"; a negative value reads "Snapjaws--100".
                const auto dash = entry.find('-');
                if (dash == std::string::npos || dash == 0) {
                    ctx.typeError("faction entry '" + entry + "' is not Name-Value");
                    return std::nullopt;
                }
                auto value = ctx.toInt(entry.substr(dash + 1), "faction " + entry.substr(0, dash));
                if (!value) return std::nullopt;
                out.emplace_back(entry.substr(0, dash), *value);
            }
            return PropertyValue{out};
        });
    add(r, "mutations", ValueType::NamedList, "Mutations with their levels, ancestors' first.",
        [](PropertyContext& ctx) -> MaybeValue {
            auto list = ctx.fragments().ofKind("mutation");
            if (list.empty()) return std::nullopt;
            NamedValueList out;
            for (const auto* f : list) {
                std::string name = f->name;
                if (const std::string* gas = Codex::Blueprints::findAttribute(f->attributes, "GasObject")) name += *gas;
                int lvl = 0;
                if (const std::string* v = Codex::Blueprints::findAttribute(f->attributes, "Level")) {
                    lvl = ctx.toInt(*v, "mutation." + f->name + ".Level").value_or(0);
                }
                out.emplace_back(std::move(name), lvl);
            }
            return PropertyValue{out};
        });
    add(r, "skills", ValueType::List, "Skills a creature starts with.", [](PropertyContext& ctx) -> MaybeValue {
        auto list = ctx.fragments().ofKind("skill");
        if (list.empty()) return std::nullopt;
        StringList out;
        for (const auto* f : list) out.push_back(f->name);
        return PropertyValue{out};
    });
    add(r, "inventory", ValueType::NamedList, "Starting inventory blueprints with counts.",
        [](PropertyContext& ctx) -> MaybeValue {
            auto list = ctx.fragments().ofKind("inventoryobject");
            if (list.empty()) return std::nullopt;
            NamedValueList out;
            for (const auto* f : list) {
                if (isInventoryPlaceholder(f->name)) continue;
                int count = 1;
                if (const std::string* n = Codex::Blueprints::findAttribute(f->attributes, "Number")) {
                    // Counts may be dice strings such as "1d4"; report the minimum.
                    if (auto bag = DiceBag::parse(*n)) {
                        count = bag->minimum();
                    } else {
                        ctx.typeError("inventory " + f->name + " Number '" + *n + "' is not a count");
                    }
                }
                out.emplace_back(f->name, count);
            }
            return PropertyValue{out};
        });
    add(r, "corpse", ValueType::Text, "Corpse blueprint dropped, when the chance is above zero.",
        [](PropertyContext& ctx) -> MaybeValue {
            const std::string* corpse = ctx.raw("part", "Corpse", "CorpseBlueprint");
            if (!corpse || ctx.integer("part", "Corpse", "CorpseChance").value_or(0) <= 0) return std::nullopt;
            return PropertyValue{*corpse};
        });
    add(
        r, "corpsechance", ValueType::Int, "Percent chance of dropping a corpse; 0 when undeclared.",
        [](PropertyContext& ctx) -> MaybeValue {
            auto chance = ctx.integer("part", "Corpse", "CorpseChance");
            if (!chance || *chance <= 0) return std::nullopt;
            return PropertyValue{*chance};
        },
        PropertyValue{0});
}

// ---- items and weapons ----------------------------------------------------

static void registerItems(PropertyRegistry& r) {
    add(r, "pv", ValueType::Int, "Base penetration: 4 + PenBonus for melee, 4 + projectile PV for missiles.",
        [](PropertyContext& ctx) -> MaybeValue {
            std::optional<int> pv;
            if (meleeWeapon(ctx)) {
                pv = 4;
                if (auto gas = ctx.integer("part", "Gaslight", "ChargedPenetrationBonus")) {
                    *pv += *gas;
                } else if (auto bonus = ctx.integer("part", "MeleeWeapon", "PenBonus")) {
                    *pv += *bonus;
                }
            }
            if (auto missile = projectileAttribute(ctx, "part.Projectile.BasePenetration")) {
                if (auto v = ctx.toInt(*missile, "part.Projectile.BasePenetration")) pv = *v + 4;
            }
            return number(pv);
        });
    add(r, "maxpv", ValueType::Int, "Penetration with the full strength bonus.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (ctx.isSpecified("part", "ThrownWeapon")) {
                return PropertyValue{ctx.integer("part", "ThrownWeapon", "Penetration").value_or(1)};
            }
            auto pv = ctx.property("pv");
            if (!pv) return std::nullopt;
            int value = std::get<int>(*pv);
            value += ctx.integer("part", "MeleeWeapon", "MaxStrengthBonus").value_or(0);
            return PropertyValue{value};
        });
    add(r, "damage", ValueType::Text, "Damage dice of melee, thrown and missile weapons.",
        [](PropertyContext& ctx) -> MaybeValue {
            std::optional<std::string> val;
            if (meleeWeapon(ctx)) {
                if (const std::string* d = ctx.raw("part", "MeleeWeapon", "BaseDamage")) val = *d;
            }
            if (ctx.has("part", "Gaslight")) {
                if (const std::string* d = ctx.raw("part", "Gaslight", "ChargedDamage")) val = *d;
            }
            if (ctx.isSpecified("part", "ThrownWeapon")) {
                const std::string* d = ctx.isSpecified("part", "GeomagneticDisk")
                                           ? ctx.raw("part", "GeomagneticDisk", "Damage")
                                           : ctx.raw("part", "ThrownWeapon", "Damage");
                val = d ? std::optional<std::string>(*d) : std::nullopt;
            }
            if (auto projectile = projectileAttribute(ctx, "part.Projectile.BaseDamage"); projectile && !projectile->empty()) {
                val = projectile;
            }
            if (!val) return std::nullopt;
            return PropertyValue{*val};
        });
    add(r, "tohit", ValueType::Int, "Bonus or penalty to hit.", [](PropertyContext& ctx) -> MaybeValue {
        if (ctx.inheritsFrom("Armor")) return number(ctx.integer("part", "Armor", "ToHit"));
        if (ctx.isSpecified("part", "MeleeWeapon")) return number(ctx.integer("part", "MeleeWeapon", "HitBonus"));
        return std::nullopt;
    });
    add(r, "accuracy", ValueType::Int, "Missile weapon accuracy.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "MissileWeapon", "WeaponAccuracy"));
    });
    add(r, "shots", ValueType::Int, "Shots fired per action.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "MissileWeapon", "ShotsPerAction"));
    });
    add(r, "maxammo", ValueType::Int, "Magazine size.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "MagazineAmmoLoader", "MaxAmmo"));
    });
    add(r, "maxcharge", ValueType::Int, "Charge a cell can hold.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "EnergyCell", "MaxCharge"));
    });
    add(r, "maxvol", ValueType::Int, "Maximum liquid volume in drams.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "LiquidVolume", "MaxVolume"));
    });
    add(r, "weight", ValueType::Int, "Physics weight of anything but creatures.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (ctx.inheritsFrom("Creature")) return std::nullopt;
            return number(ctx.integer("part", "Physics", "Weight"));
        });
    add(r, "commerce", ValueType::Decimal, "Trade value of items.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFromAny({"Item", "BaseThrownWeapon"})) return std::nullopt;
        auto value = ctx.decimal("part", "Commerce", "Value");
        if (!value) return std::nullopt;
        return PropertyValue{*value};
    });
    add(r, "carrybonus", ValueType::Int, "Carry weight bonus of armor.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "Armor", "CarryBonus"));
    });
    add(r, "chargeused", ValueType::Int, "Charge consumed per use.", [](PropertyContext& ctx) -> MaybeValue {
        std::optional<int> charge;
        if (ctx.has("part", "VibroWeapon")) {
            if (auto v = ctx.integer("part", "VibroWeapon", "ChargeUse"); v && *v > 0) charge = v;
        }
        if (ctx.has("part", "Gaslight")) {
            if (auto v = ctx.integer("part", "Gaslight", "ChargeUse"); v && *v > 0) charge = v;
        }
        static const char* kChargedParts[] = {"StunOnHit",           "EnergyAmmoLoader", "MechanicalWings",
                                              "GeomagneticDisc",     "ProgrammableRecoiler", "Teleporter",
                                              "LatchesOn"};
        for (const char* part : kChargedParts) {
            if (ctx.has("part", part)) charge = ctx.integer("part", part, "ChargeUse");
        }
        return number(charge);
    });
    add(r, "weaponskill", ValueType::Text, "Skill tree the weapon trains.", [](PropertyContext& ctx) -> MaybeValue {
        std::optional<std::string> val;
        if (meleeWeapon(ctx)) {
            if (const std::string* s = ctx.raw("part", "MeleeWeapon", "Skill")) val = *s;
        }
        if (ctx.inheritsFrom("MissileWeapon")) {
            if (const std::string* s = ctx.raw("part", "MissileWeapon", "Skill")) val = *s;
        }
        if (ctx.has("part", "Gaslight")) {
            const std::string* s = ctx.raw("part", "Gaslight", "ChargedSkill");
            val = s ? std::optional<std::string>(*s) : std::nullopt;
        }
        if (ctx.inheritsFrom("Projectile")) val.reset();
        if (ctx.inheritsFrom("Shield")) val = "Shield";
        if (!val) return std::nullopt;
        return PropertyValue{*val};
    });
    add(r, "usesslots", ValueType::List, "Body slots occupied when equipped.", [](PropertyContext& ctx) -> MaybeValue {
        const std::string* slots = ctx.raw("tag", "UsesSlots", "Value");
        if (!slots) return std::nullopt;
        return PropertyValue{Codex::Props::splitList(*slots)};
    });
    add(r, "wornon", ValueType::Text, "Body slot the item equips to.", [](PropertyContext& ctx) -> MaybeValue {
        std::optional<std::string> worn;
        if (const std::string* s = ctx.raw("part", "Shield", "WornOn"); s && !s->empty()) worn = *s;
        if (const std::string* a = ctx.raw("part", "Armor", "WornOn"); a && !a->empty()) worn = *a;
        if (!worn) return std::nullopt;
        return PropertyValue{*worn};
    });
    add(r, "twohanded", ValueType::Bool, "Whether a weapon takes both hands.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFromAny({"MeleeWeapon", "MissileWeapon"})) return std::nullopt;
        const std::string* slots = ctx.raw("tag", "UsesSlots", "Value");
        if (slots && !slots->empty() && *slots != "Hand") return std::nullopt;
        if (ctx.has("part", "Physics")) {
            const std::string* two = ctx.raw("part", "Physics", "bUsesTwoSlots");
            if (!two) two = ctx.raw("part", "Physics", "UsesTwoSlots");
            if (two && !two->empty()) return PropertyValue{true};
        }
        return PropertyValue{false};
    });
    add(r, "bits", ValueType::Text, "Tinker bits yielded, in in-game letters.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.has("part", "TinkerItem")) return std::nullopt;
        const std::string* canDisassemble = ctx.raw("part", "TinkerItem", "CanDisassemble");
        const std::string* canBuild = ctx.raw("part", "TinkerItem", "CanBuild");
        const bool disassemblable = !canDisassemble || *canDisassemble != "false";
        const bool buildable = !canBuild || *canBuild != "false";
        if (!disassemblable && !buildable) return std::nullopt;
        const std::string* bits = ctx.raw("part", "TinkerItem", "Bits");
        if (!bits) return std::nullopt;
        std::string out = *bits;
        for (char& c : out) {
            switch (c) {
                case 'G': c = 'B'; break;
                case 'R': c = 'A'; break;
                case 'C': c = 'D'; break;
                case 'B': c = 'C'; break;
                default: break;
            }
        }
        return PropertyValue{out};
    });
    add(r, "canbuild", ValueType::Bool, "Whether the item can be tinkered.", [](PropertyContext& ctx) -> MaybeValue {
        const std::string* build = ctx.raw("part", "TinkerItem", "CanBuild");
        if (build && *build == "true") return PropertyValue{true};
        const std::string* dis = ctx.raw("part", "TinkerItem", "CanDisassemble");
        if (dis && *dis == "true") return PropertyValue{false};
        return std::nullopt;
    });
    add(r, "candisassemble", ValueType::Bool, "Whether the item can be disassembled.",
        [](PropertyContext& ctx) -> MaybeValue {
            const std::string* dis = ctx.raw("part", "TinkerItem", "CanDisassemble");
            if (dis && *dis == "true") return PropertyValue{true};
            const std::string* build = ctx.raw("part", "TinkerItem", "CanBuild");
            if (build && *build == "true") return PropertyValue{false};
            return std::nullopt;
        });
}

// ---- flags ----------------------------------------------------------------

static void registerFlags(PropertyRegistry& r) {
    add(
        r, "tags", ValueType::List, "Every tag carried after inheritance, ancestors' first.",
        [](PropertyContext& ctx) -> MaybeValue {
            StringList out;
            for (const auto* f : ctx.fragments().ofKind("tag")) out.push_back(f->name);
            return PropertyValue{out};
        },
        PropertyValue{StringList{}});
    add(r, "solid", ValueType::Bool, "Physics Solid, when this blueprint declares it.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.isSpecified("part", "Physics", "Solid")) return std::nullopt;
            return PropertyValue{isTrue(ctx.raw("part", "Physics", "Solid"))};
        });
    add(r, "metal", ValueType::Bool, "Made of metal.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "Metal"));
    });
    add(r, "pettable", ValueType::Bool, "Can be pet.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "Pettable"));
    });
    add(r, "cursed", ValueType::Bool, "Cannot be unequipped normally.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "Cursed"));
    });
    add(r, "hidden", ValueType::Int, "Difficulty to find a hidden object.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "Hidden", "Difficulty"));
    });
    add(r, "isoccluding", ValueType::Bool, "Blocks line of sight.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(isTrue(ctx.raw("part", "Render", "Occluding")));
    });
    add(r, "flyover", ValueType::Bool, "Flying creatures may pass over a wall or furniture.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.inheritsFromAny({"Wall", "Furniture"})) return std::nullopt;
            return PropertyValue{ctx.has("tag", "Flyover")};
        });
    add(r, "isswarmer", ValueType::Bool, "Creature fights as a swarm.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.inheritsFrom("Creature") && ctx.isSpecified("part", "Swarmer"));
    });
    add(r, "swarmbonus", ValueType::Int, "Extra bonus a swarmer receives.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "Swarmer", "ExtraBonus"));
    });
    add(r, "aquatic", ValueType::Bool, "Creature must stay submerged.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.inheritsFrom("Creature")) return std::nullopt;
        const std::string* aquatic = ctx.raw("part", "Brain", "Aquatic");
        if (!aquatic) return std::nullopt;
        return PropertyValue{*aquatic == "true"};
    });
    add(r, "waterritualable", ValueType::Bool, "Can be the partner of a water ritual.",
        [](PropertyContext& ctx) -> MaybeValue {
            return flag(ctx.isSpecified("xtag", "WaterRitual") || ctx.has("part", "GivesRep"));
        });
}

// ---- mods, ammunition and powered equipment -------------------------------

struct ModComplexity {
    const char* mod;
    int complexity;
    bool onlyIfComplex;
};

// Complexity an item mod adds; some only add to an item that is already complex.
static const ModComplexity kModComplexity[] = {
    {"ModCounterweighted", 1, true},
    {"ModElectrified", 1, false},
    {"ModEngraved", 0, false},
    {"ModExtradimensional", 4, true},
    {"ModFlaming", 1, false},
    {"ModFreezing", 1, false},
    {"ModGesticulating", 1, false},
    {"ModGlassArmor", 0, false},
    {"ModHeatSeeking", 1, true},
    {"ModImprovedElectricalGeneration", 0, false},
    {"ModImprovedTemporalFugue", 0, false},
    {"ModJewelEncrusted", 0, false},
    {"ModMasterwork", 1, true},
    {"ModPainted", 0, false},
    {"ModPiping", 0, false},
    {"ModRazored", 1, true},
    {"ModScoped", 1, false},
    {"ModSharp", 1, true},
    {"ModSpringLoaded", 1, false},
    {"ModSturdy", 0, false},
    {"ModWired", 0, true},
};

static const ModComplexity* findModComplexity(const std::string& mod) {
    for (const auto& entry : kModComplexity) {
        if (mod == entry.mod) return &entry;
    }
    return nullptr;
}

static bool isModPart(const std::string& name) { return name.compare(0, 3, "Mod") == 0; }

// AddMod entries first, then Mod* parts; a mod without a tier is tier 1.
static std::optional<NamedValueList> itemMods(PropertyContext& ctx) {
    NamedValueList mods;
    if (const std::string* names = ctx.raw("part", "AddMod", "Mods")) {
        StringList tiers;
        if (const std::string* t = ctx.raw("part", "AddMod", "Tiers")) tiers = Codex::Props::splitList(*t);
        const StringList list = Codex::Props::splitList(*names);
        for (std::size_t i = 0; i < list.size(); ++i) {
            int tier = 1;
            if (i < tiers.size()) {
                auto v = ctx.toInt(tiers[i], "part.AddMod.Tiers");
                if (!v) return std::nullopt;
                tier = *v;
            }
            mods.emplace_back(list[i], tier);
        }
    }
    for (const auto* f : ctx.fragments().ofKind("part")) {
        if (!isModPart(f->name)) continue;
        int tier = 1;
        if (const std::string* t = Codex::Blueprints::findAttribute(f->attributes, "Tier")) {
            auto v = ctx.toInt(*t, "part." + f->name + ".Tier");
            if (!v) return std::nullopt;
            tier = *v;
        }
        mods.emplace_back(f->name, tier);
    }
    return mods;
}

static const char* elementalMod(const PropertyContext& ctx) {
    static const char* kMods[] = {"ModFlaming", "ModFreezing", "ModElectrified"};
    for (const char* mod : kMods) {
        if (ctx.isSpecified("part", mod)) return mod;
    }
    return nullptr;
}

static bool isVibro(const PropertyContext& ctx) {
    if (ctx.isSpecified("part", "ThrownWeapon")) return ctx.isSpecified("part", "GeomagneticDisk");
    return ctx.inheritsFromAny({"NaturalWeapon", "MeleeWeapon"}) && ctx.has("part", "VibroWeapon");
}

static void registerEquipment(PropertyRegistry& r) {
    add(r, "mods", ValueType::NamedList, "Item mods with their tiers.", [](PropertyContext& ctx) -> MaybeValue {
        auto mods = itemMods(ctx);
        if (!mods || mods->empty()) return std::nullopt;
        return PropertyValue{*mods};
    });
    add(r, "modcount", ValueType::Int, "Number of item mods.", [](PropertyContext& ctx) -> MaybeValue {
        int count = 0;
        if (const std::string* names = ctx.raw("part", "AddMod", "Mods")) {
            count += static_cast<int>(Codex::Props::splitList(*names).size());
        }
        for (const auto* f : ctx.fragments().ofKind("part")) {
            if (isModPart(f->name)) ++count;
        }
        if (count == 0) return std::nullopt;
        return PropertyValue{count};
    });
    add(r, "complexity", ValueType::Int, "Examiner complexity plus what the mods add.",
        [](PropertyContext& ctx) -> MaybeValue {
            int value = ctx.integer("part", "Examiner", "Complexity").value_or(0);
            auto apply = [&value](const std::string& mod) {
                const ModComplexity* entry = findModComplexity(mod);
                if (!entry || (entry->onlyIfComplex && value <= 0)) return;
                value += entry->complexity;
            };
            if (const std::string* names = ctx.raw("part", "AddMod", "Mods")) {
                for (const auto& mod : Codex::Props::splitList(*names)) apply(mod);
            }
            for (const auto* f : ctx.fragments().ofKind("part")) {
                if (isModPart(f->name)) apply(f->name);
            }
            if (value > 0) return PropertyValue{value};
            auto build = ctx.property("canbuild");
            if (build && std::get_if<bool>(&*build) && std::get<bool>(*build)) return PropertyValue{value};
            return std::nullopt;
        });
    add(r, "reflect", ValueType::Int, "Percent of damage reflected by glass armor.",
        [](PropertyContext& ctx) -> MaybeValue { return number(ctx.integer("part", "ModGlassArmor", "Tier")); });
    add(r, "elementaldamage", ValueType::Text, "Elemental damage range of a weapon.",
        [](PropertyContext& ctx) -> MaybeValue {
            const char* mod = elementalMod(ctx);
            if (!mod) return text(ctx.raw("part", "MeleeWeapon", "ElementalDamage"));
            auto tier = ctx.integer("part", mod, "Tier");
            if (!tier) return std::nullopt;
            const int t = *tier;
            if (std::string(mod) == "ModElectrified") {
                return PropertyValue{std::to_string(t) + "-" + std::to_string(static_cast<int>(t * 1.5))};
            }
            return PropertyValue{std::to_string(static_cast<int>(t * 0.8)) + "-" +
                                 std::to_string(static_cast<int>(t * 1.2))};
        });
    add(r, "elementaltype", ValueType::Text, "Kind of elemental damage dealt.", [](PropertyContext& ctx) -> MaybeValue {
        const char* mod = elementalMod(ctx);
        if (!mod) return text(ctx.raw("part", "MeleeWeapon", "Element"));
        const std::string name = mod;
        if (name == "ModFlaming") return PropertyValue{std::string("Fire")};
        if (name == "ModFreezing") return PropertyValue{std::string("Cold")};
        return PropertyValue{std::string("Electric")};
    });
    add(r, "vibro", ValueType::Bool, "Whether the weapon adapts its penetration to the target.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.isSpecified("part", "ThrownWeapon") && !ctx.inheritsFromAny({"NaturalWeapon", "MeleeWeapon"})) {
                return std::nullopt;
            }
            return PropertyValue{isVibro(ctx)};
        });
    add(r, "pvpowered", ValueType::Bool, "Whether penetration changes when powered.",
        [](PropertyContext& ctx) -> MaybeValue {
            const bool vibroCharged =
                isVibro(ctx) &&
                (!ctx.has("part", "VibroWeapon") || ctx.integer("part", "VibroWeapon", "ChargeUse").value_or(0) > 0);
            const bool gasCharged =
                ctx.has("part", "Gaslight") && ctx.integer("part", "Gaslight", "ChargeUse").value_or(0) > 0;
            return flag(vibroCharged || gasCharged);
        });
    add(r, "energycellrequired", ValueType::Bool, "Needs an energy cell to function.",
        [](PropertyContext& ctx) -> MaybeValue { return flag(ctx.isSpecified("part", "EnergyCellSocket")); });
    add(r, "empsensitive", ValueType::Bool, "Disabled by electromagnetic pulses.",
        [](PropertyContext& ctx) -> MaybeValue {
            static const char* kFlagged[] = {"EquipStatBoost",         "BootSequence",    "NavigationBonus",
                                             "SaveModifier",           "LiquidFueledPowerPlant", "LiquidProducer",
                                             "TemperatureAdjuster"};
            for (const char* part : kFlagged) {
                const std::string* v = ctx.raw("part", part, "IsEMPSensitive");
                if (v && *v == "true") return PropertyValue{true};
            }
            static const char* kPowered[] = {"EnergyCellSocket", "ZeroPointEnergyCollector", "ModFlaming", "ModFreezing",
                                             "ModElectrified"};
            for (const char* part : kPowered) {
                if (ctx.has("part", part)) return PropertyValue{true};
            }
            return std::nullopt;
        });
    add(r, "chargefunction", ValueType::Text, "What the charge powers.", [](PropertyContext& ctx) -> MaybeValue {
        StringList uses;
        if (ctx.has("part", "StunOnHit")) uses.push_back("stun effect");
        if (ctx.has("part", "EnergyAmmoLoader") || ctx.has("part", "Gaslight")) uses.push_back("weapon power");
        if (ctx.has("part", "VibroWeapon") && ctx.integer("part", "VibroWeapon", "ChargeUse").value_or(0) > 0) {
            uses.push_back("adaptive penetration");
        }
        if (ctx.has("part", "MechanicalWings")) uses.push_back("flight");
        if (ctx.has("part", "GeomagneticDisk")) uses.push_back("disc effect");
        if (ctx.has("part", "ProgrammableRecoiler") || ctx.has("part", "Teleporter")) uses.push_back("teleportation");
        if (uses.empty()) return std::nullopt;
        std::string out;
        for (const auto& use : uses) {
            if (!out.empty()) out += ", ";
            out += use;
        }
        out[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[0])));
        return PropertyValue{out};
    });
    add(r, "chargeperdram", ValueType::Int, "Charge held per dram of fuel.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "LiquidFueledEnergyCell", "ChargePerDram"));
    });
    add(r, "unpowereddamage", ValueType::Text, "Damage dealt without charge.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Gaslight", "UnchargedDamage"));
    });
    add(r, "ammo", ValueType::Text, "Ammunition a missile weapon consumes.", [](PropertyContext& ctx) -> MaybeValue {
        if (const std::string* part = ctx.raw("part", "MagazineAmmoLoader", "AmmoPart"); part && !part->empty()) {
            static const std::pair<const char*, const char*> kAmmo[] = {
                {"AmmoSlug", "lead slug"}, {"AmmoShotgunShell", "shotgun shell"}, {"AmmoGrenade", "grenade"},
                {"AmmoMissile", "missile"}, {"AmmoArrow", "arrow"},               {"AmmoDart", "dart"}};
            for (const auto& entry : kAmmo) {
                if (*part == entry.first) return PropertyValue{std::string(entry.second)};
            }
            return std::nullopt;
        }
        if (ctx.integer("part", "EnergyAmmoLoader", "ChargeUse").value_or(0) > 0) {
            const std::string* slot = ctx.raw("part", "EnergyCellSocket", "SlotType");
            if (slot && *slot == "EnergyCell") return PropertyValue{std::string("energy")};
            if (ctx.has("part", "LiquidFueledPowerPlant")) return text(ctx.raw("part", "LiquidFueledPowerPlant", "Liquid"));
            return std::nullopt;
        }
        return text(ctx.raw("part", "LiquidAmmoLoader", "Liquid"));
    });
    add(r, "ammodamagetypes", ValueType::List, "Damage attributes of the fired projectile.",
        [](PropertyContext& ctx) -> MaybeValue {
            auto attributes = projectileAttribute(ctx, "part.Projectile.Attributes");
            if (!attributes) return std::nullopt;
            return PropertyValue{Codex::Props::splitList(*attributes, ' ')};
        });
    add(r, "gasemitted", ValueType::Text, "Gas released by the fired projectile.", [](PropertyContext& ctx) -> MaybeValue {
        auto gas = projectileAttribute(ctx, "part.GasOnHit.Blueprint");
        if (!gas) return std::nullopt;
        return PropertyValue{*gas};
    });
    add(r, "penetratingammo", ValueType::Bool, "Projectiles pass through creatures.",
        [](PropertyContext& ctx) -> MaybeValue {
            return flag(projectileAttribute(ctx, "part.Projectile.PenetrateCreatures").has_value());
        });
    add(r, "shotcooldown", ValueType::Text, "Cooldown between shots, usually dice.",
        [](PropertyContext& ctx) -> MaybeValue { return text(ctx.raw("part", "CooldownAmmoLoader", "Cooldown")); });
    add(r, "dramsperuse", ValueType::Int, "Drams of liquid each shot consumes.", [](PropertyContext& ctx) -> MaybeValue {
        if (!ctx.isSpecified("part", "LiquidAmmoLoader")) return std::nullopt;
        return PropertyValue{1};
    });
    add(r, "temponenter", ValueType::Text, "Temperature change in each cell a shot passes.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (auto t = projectileAttribute(ctx, "part.TemperatureOnEntering.Amount"); t && !t->empty()) {
                return PropertyValue{*t};
            }
            return text(ctx.raw("part", "TemperatureOnEntering", "Amount"));
        });
    add(r, "temponhit", ValueType::Text, "Temperature change on hit.", [](PropertyContext& ctx) -> MaybeValue {
        if (auto t = projectileAttribute(ctx, "part.TemperatureOnHit.Amount"); t && !t->empty()) return PropertyValue{*t};
        return text(ctx.raw("part", "TemperatureOnHit", "Amount"));
    });
    add(r, "temponhitmax", ValueType::Int, "Temperature past which a hit no longer changes it.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (auto t = projectileAttribute(ctx, "part.TemperatureOnHit.MaxTemp")) {
                return number(ctx.toInt(*t, "part.TemperatureOnHit.MaxTemp"));
            }
            return number(ctx.integer("part", "TemperatureOnHit", "MaxTemp"));
        });
    add(r, "lightradius", ValueType::Int, "Radius of light given off.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "LightSource", "Radius"));
    });
    add(r, "lightprojectile", ValueType::Bool, "Fires light, which heat-immune creatures ignore.",
        [](PropertyContext& ctx) -> MaybeValue { return flag(ctx.has("tag", "Light")); });
    add(r, "flametemperature", ValueType::Int, "Temperature at which an item catches fire.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.inheritsFrom("Item") || !ctx.isSpecified("part", "Physics")) return std::nullopt;
            return number(ctx.integer("part", "Physics", "FlameTemperature"));
        });
    add(r, "savemodifier", ValueType::Text, "Kind of saving throw modified.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "SaveModifier", "Vs"));
    });
    add(r, "savemodifieramt", ValueType::Int, "Amount of the saving throw modifier.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.raw("part", "SaveModifier", "Vs")) return std::nullopt;
            return number(ctx.integer("part", "SaveModifier", "Amount"));
        });
    add(r, "movespeedbonus", ValueType::Int, "Move speed bonus granted by an item.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.inheritsFrom("Item")) return std::nullopt;
            auto amount = ctx.integer("part", "MoveCostMultiplier", "Amount");
            if (!amount) return std::nullopt;
            return PropertyValue{-*amount};
        });
    add(r, "reputationbonus", ValueType::NamedList, "Reputation granted per faction.",
        [](PropertyContext& ctx) -> MaybeValue {
            if (!ctx.has("part", "AddsRep")) return std::nullopt;
            const std::string* factions = ctx.raw("part", "AddsRep", "Faction");
            if (!factions) return std::nullopt;
            NamedValueList out;
            for (const auto& entry : Codex::Props::splitList(*factions)) {
                // "Fungi:200" carries its own value; a bare faction takes the part's Value.
                const auto colon = entry.find(':');
                std::optional<int> value;
                if (colon != std::string::npos) {
                    value = ctx.toInt(entry.substr(colon + 1), "reputation " + entry.substr(0, colon));
                } else {
                    value = ctx.integer("part", "AddsRep", "Value");
                    if (!value) ctx.typeError("reputation " + entry + " has no value");
                }
                if (!value) return std::nullopt;
                out.emplace_back(entry.substr(0, colon), *value);
            }
            return PropertyValue{out};
        });
    add(r, "destroyonunequip", ValueType::Bool, "Destroyed when unequipped.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "DestroyOnUnequip"));
    });
    add(r, "spectacles", ValueType::Bool, "Corrects vision.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "Spectacles"));
    });
    add(r, "noprone", ValueType::Bool, "Prevents being knocked prone.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("part", "NoKnockdown"));
    });
    add(r, "bookid", ValueType::Text, "Book entry the object opens.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Book", "ID"));
    });
    add(r, "liquidgen", ValueType::Int, "Turns to produce one dram of liquid.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "LiquidProducer", "Rate"));
    });
    add(r, "liquidtype", ValueType::Text, "Liquid a producer generates.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "LiquidProducer", "Liquid"));
    });
    add(r, "liquidburst", ValueType::Text, "Liquid released on destruction.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "LiquidBurst", "Liquid"));
    });
}

// ---- food and materials ---------------------------------------------------

static void registerFood(PropertyRegistry& r) {
    add(r, "isfungus", ValueType::Bool, "Contains fungus.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("tag", "Mushroom"));
    });
    add(r, "isplant", ValueType::Bool, "Contains plants.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("tag", "Plant"));
    });
    add(r, "ismeat", ValueType::Bool, "Contains meat.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("tag", "Meat"));
    });
    add(r, "exoticfood", ValueType::Bool, "Asks before being preserved.", [](PropertyContext& ctx) -> MaybeValue {
        return flag(ctx.has("tag", "ChooseToPreserve"));
    });
    add(r, "healing", ValueType::Text, "Hitpoints restored when eaten.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Food", "Healing"));
    });
    add(r, "hunger", ValueType::Text, "Hunger satiated, e.g. Snack.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Food", "Satiation"));
    });
    add(r, "thirst", ValueType::Int, "Thirst slaked.", [](PropertyContext& ctx) -> MaybeValue {
        return number(ctx.integer("part", "Food", "Thirst"));
    });
    add(r, "eatdesc", ValueType::Text, "Message shown when eaten.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Food", "Message"));
    });
    add(r, "illoneat", ValueType::Bool, "Eating it makes you sick.", [](PropertyContext& ctx) -> MaybeValue {
        if (ctx.inheritsFrom("Corpse")) return std::nullopt;
        const std::string* ill = ctx.raw("part", "Food", "IllOnEat");
        return flag(ill && *ill == "true");
    });
    add(r, "oneat", ValueType::List, "Effects granted when eaten, e.g. BreatheOnEatFireBreather5.",
        [](PropertyContext& ctx) -> MaybeValue {
            StringList effects;
            for (const auto* f : ctx.fragments().ofKind("part")) {
                const std::string& name = f->name;
                if (name.size() < 5 || name.compare(name.size() - 5, 5, "OnEat") != 0) continue;
                std::string effect = name;
                if (const std::string* cls = Codex::Blueprints::findAttribute(f->attributes, "Class")) {
                    effect += *cls;
                    if (const std::string* lvl = Codex::Blueprints::findAttribute(f->attributes, "Level")) effect += *lvl;
                }
                effects.push_back(std::move(effect));
            }
            if (effects.empty()) return std::nullopt;
            return PropertyValue{effects};
        });
    add(r, "cookeffect", ValueType::List, "Cooking effect families of an ingredient.",
        [](PropertyContext& ctx) -> MaybeValue {
            const std::string* type = ctx.raw("part", "PreparedCookingIngredient", "type");
            if (!type) return std::nullopt;
            return PropertyValue{Codex::Props::splitList(*type)};
        });
    add(r, "butcheredinto", ValueType::Text, "What a corpse is butchered into.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Butcherable", "OnSuccess"));
    });
    add(r, "harvestedinto", ValueType::Text, "What harvesting produces.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Harvestable", "OnSuccess"));
    });
    add(r, "preservedinto", ValueType::Text, "What preserving produces.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "PreservableItem", "Result"));
    });
    add(r, "preservedquantity", ValueType::Int, "How many preserves are produced.",
        [](PropertyContext& ctx) -> MaybeValue { return number(ctx.integer("part", "PreservableItem", "Number")); });
    add(r, "iscurrency", ValueType::Bool, "Trades at a fixed price.", [](PropertyContext& ctx) -> MaybeValue {
        const std::string* currency = ctx.raw("intproperty", "Currency", "Value");
        return flag(currency && *currency == "1");
    });
}

// ---- rendering ------------------------------------------------------------

static void registerRendering(PropertyRegistry& r) {
    add(r, "renderstr", ValueType::Text, "Text-mode character.", [](PropertyContext& ctx) -> MaybeValue {
        auto c = renderCharacter(ctx.fragments());
        if (!c) return std::nullopt;
        return PropertyValue{*c};
    });
    add(r, "colorstr", ValueType::Text, "ColorString of the Render or Gas part.", [](PropertyContext& ctx) -> MaybeValue {
        if (const std::string* c = ctx.raw("part", "Render", "ColorString"); c && !c->empty()) return PropertyValue{*c};
        if (const std::string* g = ctx.raw("part", "Gas", "ColorString"); g && !g->empty()) return PropertyValue{*g};
        return std::nullopt;
    });
    add(r, "tilecolor", ValueType::Text, "Render TileColor.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Render", "TileColor"));
    });
    add(r, "detailcolor", ValueType::Text, "Render DetailColor.", [](PropertyContext& ctx) -> MaybeValue {
        return text(ctx.raw("part", "Render", "DetailColor"));
    });
    add(r, "tile", ValueType::Text, "Glyph image path, when the object renders.", [](PropertyContext& ctx) -> MaybeValue {
        auto attrs = renderAttributesFor(ctx.fragments(), ctx.id());
        if (!attrs || attrs->glyph.empty()) return std::nullopt;
        return PropertyValue{attrs->glyph};
    });
}

void registerObjectProps(PropertyRegistry& registry) {
    registerIdentity(registry);
    registerStats(registry);
    registerItems(registry);
    registerEquipment(registry);
    registerFood(registry);
    registerFlags(registry);
    registerRendering(registry);
}

}  // namespace Qud::Catalog
