// Dice strings, level-scaled sValues and color markup helpers.
#include <cassert>
#include <string>

#include "../game/catalog/ColorMarkup.h"
#include "../game/catalog/DiceBag.h"
#include "../game/catalog/SValue.h"

using namespace Qud::Catalog;

int main() {
    {
        auto bag = DiceBag::parse("3d2-1");
        assert(bag);
        assert(bag->average() == 3.5);
        assert(bag->minimum() == 2);
        assert(bag->maximum() == 5);
        assert(bag->dice().size() == 2);
        assert(bag->dice()[1].quantity == -1);
    }
    {
        auto bag = DiceBag::parse("7+1d3+3d2-1+1");
        assert(bag);
        assert(bag->average() == 13.5);
        assert(bag->minimum() == 11);
        assert(bag->maximum() == 16);
    }
    {
        // "+-" reads as subtraction; whitespace is ignored.
        auto bag = DiceBag::parse(" 1d6 +- 2 ");
        assert(bag);
        assert(bag->average() == 1.5);
        assert(bag->text() == "1d6+-2");
    }
    {
        std::string error;
        assert(!DiceBag::parse("5001d2", &error));
        assert(error.find("too many") != std::string::npos);
        assert(!DiceBag::parse("1d501", &error));
        assert(!DiceBag::parse("1d0", &error));
        assert(!DiceBag::parse("1x4", &error));
        assert(!DiceBag::parse("1d4+", &error));
        assert(!DiceBag::parse("", &error));
        assert(DiceBag::parse("5000d500"));
    }
    {
        // Each term is within limits but the sum would not fit an int.
        std::string many = "5000d500";
        for (int k = 0; k < 900; ++k) many += "+5000d500";
        std::string error;
        assert(!DiceBag::parse(many, &error));
        assert(error.find("out of range") != std::string::npos);
        std::string negative = "-5000d500";
        for (int k = 0; k < 900; ++k) negative += "-5000d500";
        assert(!DiceBag::parse(negative));
        std::string half = "5000d500";
        for (int k = 0; k < 499; ++k) half += "+5000d500";
        assert(DiceBag::parse(half) && DiceBag::parse(half)->maximum() == 1250000000);
        assert(!SValue::parse(half + "," + half, 1, &error));
        auto wide = DiceBag::parse("800d500+800d500");
        assert(wide && wide->maximum() == 800000 && wide->minimum() == 1600);
    }
    {
        // t = level / 5 + 1.
        assert(SValue::tierForLevel(1) == 1);
        assert(SValue::tierForLevel(5) == 2);
        auto sv = SValue::parse("16,1d3,(t-1)d2");
        assert(sv);
        auto bounds = DiceBag::parse(sv->diceString());
        assert(bounds && bounds->minimum() == 17 && bounds->maximum() == 19);
        auto leveled = SValue::parse("16,1d3,(t-1)d2", 5);
        assert(leveled);
        assert(leveled->diceString() == "16+1d3+1d2");
        assert(DiceBag::parse(leveled->diceString())->maximum() == 21);
    }
    {
        auto sv = SValue::parse("1d4+4,(t+1),3+2");
        assert(sv);
        assert(sv->diceString() == "1d4+4+2+3+2");
        assert(DiceBag::parse(sv->diceString())->minimum() == 12);
        auto hundred = SValue::parse("(t)d100");
        assert(hundred && hundred->diceString() == "1d100");
        auto pair = SValue::parse("1d5,1d5");
        assert(pair && pair->diceString() == "1d5+1d5");
        assert(pair->average() == 6.0);
    }
    {
        std::string error;
        assert(!SValue::parse("(t*2)d4", 1, &error));
        assert(!error.empty());
        assert(!SValue::parse("(t-1", 1, &error));
        assert(!SValue::parse("", 1, &error));
    }
    {
        assert(parseLevel("18-29") == 18);
        assert(parseLevel("7") == 7);
        assert(!parseLevel("high"));
    }
    {
        assert(stripColors("{{c|iron}} long sword") == "iron long sword");
        assert(stripColors("&Gglow&yfish") == "glowfish");
        assert(stripColors("salt && sugar") == "salt & sugar");
        assert(stripColors("{{R|{{r|blood}}-soaked}} rag") == "blood-soaked rag");
        assert(foregroundCode("&Y^k") == "Y");
        assert(backgroundCode("&Y^k") == "k");
        assert(foregroundCode("transparent") == "transparent");
        assert(backgroundCode("&y").empty());
    }
    return 0;
}
