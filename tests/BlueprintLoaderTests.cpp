// Parsing repaired markup into records and loading whole datasets.
#include <cassert>
#include <string>
#include <vector>

#include "../engine/blueprint/BlueprintLoader.h"
#include "../engine/blueprint/Dataset.h"
#include "SampleBlueprints.h"

using namespace Codex;
using namespace Codex::Blueprints;

int main() {
    CodexTests::silenceLogs();
    {
        // rawSource holds the element's own bytes, spacing and quoting included.
        const std::string lamp =
            "<object   Name='Lamp' Inherits=\"Item\">\n"
            "    <part Name=\"Render\" DisplayName=\"lamp > torch\"/>\n"
            "    <![CDATA[ </object> ]]>\n"
            "  </object>";
        const std::string markup =
            "<?xml version=\"1.0\"?>\n"
            "<!DOCTYPE objects [ <!ELEMENT objects ANY> ]>\n"
            "<objects>\n"
            "  <!-- <object Name=\"Ghost\"/> -->\n"
            "  " + lamp + "\n"
            "  <object Name=\"Item\" />\n"
            "</objects>\n";
        LoadError error;
        auto records = BlueprintLoader::parse(markup, "Lamps.xml", error);
        assert(records);
        assert(records->size() == 2);
        assert((*records)[0].id == "Lamp");
        assert((*records)[0].rawSource == lamp);
        assert((*records)[1].rawSource == "<object Name=\"Item\" />");
        assert(*findAttribute((*records)[0].findFragment("part", "Render")->attributes, "DisplayName") == "lamp > torch");
    }
    {
        LoadError error;
        auto records = BlueprintLoader::parse(
            "<objects>"
            "<object Name=\"Widget\" Inherits=\"Item\">"
            "<part Name=\"Render\" DisplayName=\"widget\" Tile=\"Items/w.bmp\"/>"
            "<part Name=\"Render\" ColorString=\"&amp;Y\"/>"
            "<inventoryobject Blueprint=\"Torch\" Number=\"2\"/>"
            "<xtagGrammar Proper=\"true\"/>"
            "<removepart Name=\"Physics\"/>"
            "<mystery Flavor=\"odd\"/>"
            "</object>"
            "<object Name=\"Item\"/>"
            "</objects>",
            "Items.xml", error);
        assert(records);
        assert(records->size() == 2);
        const BlueprintRecord& widget = (*records)[0];
        assert(widget.id == "Widget");
        assert(widget.parentId && *widget.parentId == "Item");
        assert(widget.sourceName == "Items.xml");
        assert(!widget.rawSource.empty());
        assert(widget.rawSource.find("Widget") != std::string::npos);

        // Repeated parts fold into the first declaration.
        const Fragment* render = widget.findFragment("part", "Render");
        assert(render);
        assert(render->attributes.size() == 3);
        assert(*findAttribute(render->attributes, "ColorString") == "&Y");
        assert(*findAttribute(render->attributes, "Tile") == "Items/w.bmp");
        assert(!findAttribute(render->attributes, "Name"));

        const Fragment* torch = widget.findFragment("inventoryobject", "Torch");
        assert(torch && *findAttribute(torch->attributes, "Number") == "2");
        const Fragment* grammar = widget.findFragment("xtag", "Grammar");
        assert(grammar && *findAttribute(grammar->attributes, "Proper") == "true");
        assert(widget.findFragment("removepart", "Physics"));
        // Unknown kinds are kept.
        const Fragment* mystery = widget.findFragment("mystery", "");
        assert(mystery && *findAttribute(mystery->attributes, "Flavor") == "odd");

        assert(!(*records)[1].parentId);
        assert((*records)[1].fragments.empty());
    }
    {
        LoadError error;
        auto records = BlueprintLoader::parse("<objects><object Name=\"A\"></objects>", "Bad.xml", error);
        assert(!records);
        assert(error.kind == LoadErrorKind::MalformedSource);
        assert(error.source == "Bad.xml");
        assert(!error.message.empty());
    }
    {
        LoadError error;
        auto records = BlueprintLoader::parse("<objects><object Inherits=\"A\"/></objects>", "Nameless.xml", error);
        assert(!records);
        assert(error.kind == LoadErrorKind::MalformedSource);
    }
    {
        LoadError error;
        auto records =
            BlueprintLoader::parse("<objects><object Name=\"A\"/><object Name=\"A\"/></objects>", "Dup.xml", error);
        assert(!records);
        assert(error.kind == LoadErrorKind::DuplicateBlueprint);
        assert(error.subjects == std::vector<std::string>{"A"});
    }
    {
        // Duplicates across sources.
        LoadError error;
        std::vector<SourceFile> sources{
            {"One.xml", "<objects><object Name=\"Root\"/><object Name=\"A\" Inherits=\"Root\"/></objects>"},
            {"Two.xml", "<objects><object Name=\"A\" Inherits=\"Root\"/></objects>"},
        };
        auto dataset = loadDataset(sources, "2.0.206", error);
        assert(!dataset);
        assert(error.kind == LoadErrorKind::DuplicateBlueprint);
        assert(error.source == "Two.xml");
        assert(error.subjects.front() == "A");
    }
    {
        // Raw game markup: control bytes, CRLF and stray ampersands load after repair.
        LoadError error;
        std::vector<SourceFile> sources{
            {"Creatures.xml",
             "<objects>\r\n<object Name=\"Root\">\r\n<part Name=\"Render\" ColorString=\"&R^k\" RenderString=\"\x02\"/>"
             "\r\n</object>\r\n</objects>\r\n"},
            {"Items.xml", "<objects><object Name=\"Child\" Inherits=\"Root\"/></objects>"},
        };
        auto dataset = loadDataset(sources, "2.0.206", error);
        assert(dataset);
        assert(!error.failed());
        assert(dataset->version == "2.0.206");
        assert(dataset->tree.size() == 2);
        assert(dataset->repairs.charactersReplaced == 1);
        assert(dataset->repairs.lineBreaksRepaired == 5);
        assert(dataset->repairs.entitiesEscaped == 1);
        const BlueprintNode& root = dataset->tree.root();
        const Fragment* render = root.record().findFragment("part", "Render");
        assert(*findAttribute(render->attributes, "ColorString") == "&R^k");
        assert(*findAttribute(render->attributes, "RenderString") == "\xE2\x98\xBB");
        assert(root.record().line == 2);
    }
    {
        // A control character stored as a reference still loads.
        LoadError error;
        std::vector<SourceFile> sources{
            {"Glyphs.xml", "<objects><object Name=\"O\"><part Name=\"Description\" Short=\"a &#11; b\"/>"
                           "</object></objects>"}};
        auto dataset = loadDataset(sources, "", error);
        assert(dataset);
        assert(!error.failed());
        assert(dataset->repairs.charactersReplaced == 1);
        const Fragment* description = dataset->tree.root().record().findFragment("part", "Description");
        assert(*findAttribute(description->attributes, "Short") == "a \xE2\x99\x82 b");
    }
    {
        LoadError error;
        std::vector<SourceFile> sources{{"ObjectBlueprints.xml", std::string(CodexTests::kObjectsXml)}};
        auto dataset = loadDataset(sources, "", error);
        assert(dataset);
        assert(dataset->tree.size() == 12);
        assert(dataset->tree.root().id() == "Object");
    }
    return 0;
}
