#include "BlueprintLoader.h"

#include <cctype>
#include <cstring>
#include <memory>
#include <string_view>
#include <unordered_set>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xmlerror.h>

#include "../core/Logger.h"

namespace Codex::Blueprints {

const std::string* findAttribute(const AttributeList& attrs, const std::string& key) {
    for (const auto& kv : attrs) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

void setAttribute(AttributeList& attrs, const std::string& key, std::string value) {
    for (auto& kv : attrs) {
        if (kv.first == key) {
            kv.second = std::move(value);
            return;
        }
    }
    attrs.emplace_back(key, std::move(value));
}

const Fragment* BlueprintRecord::findFragment(const std::string& kind, const std::string& name) const {
    for (const auto& f : fragments) {
        if (f.kind == kind && f.name == name) return &f;
    }
    return nullptr;
}

namespace {
using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

std::string toString(const xmlChar* s) {
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}

bool isElement(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE && std::strcmp(reinterpret_cast<const char*>(node->name), name) == 0;
}

AttributeList readAttributes(xmlDoc* doc, const xmlNode* node) {
    AttributeList attrs;
    for (const xmlAttr* a = node->properties; a != nullptr; a = a->next) {
        xmlChar* value = xmlNodeListGetString(doc, a->children, 1);
        attrs.emplace_back(toString(a->name), toString(value));
        if (value) xmlFree(value);
    }
    return attrs;
}

std::string takeAttribute(AttributeList& attrs, const std::string& key) {
    for (auto it = attrs.begin(); it != attrs.end(); ++it) {
        if (it->first == key) {
            std::string value = std::move(it->second);
            attrs.erase(it);
            return value;
        }
    }
    return {};
}

std::string dumpNode(xmlDoc* doc, xmlNode* node) {
    std::unique_ptr<xmlBuffer, decltype(&xmlBufferFree)> buf(xmlBufferCreate(), &xmlBufferFree);
    if (!buf) return {};
    if (xmlNodeDump(buf.get(), doc, node, 0, 0) < 0) return {};
    return toString(xmlBufferContent(buf.get()));
}

std::size_t skipPast(std::string_view markup, std::size_t from, std::string_view terminator) {
    const std::size_t at = markup.find(terminator, from);
    return at == std::string_view::npos ? std::string_view::npos : at + terminator.size();
}

// Byte ranges of the <object> elements directly under the document root, in document order.
std::vector<std::string_view> objectElements(std::string_view markup) {
    std::vector<std::string_view> out;
    std::size_t objectStart = std::string_view::npos;
    int depth = 0;
    std::size_t i = 0;
    while ((i = markup.find('<', i)) != std::string_view::npos) {
        if (markup.compare(i, 4, "<!--") == 0) {
            i = skipPast(markup, i + 4, "-->");
            continue;
        }
        if (markup.compare(i, 9, "<![CDATA[") == 0) {
            i = skipPast(markup, i + 9, "]]>");
            continue;
        }
        if (markup.compare(i, 2, "<?") == 0) {
            i = skipPast(markup, i + 2, "?>");
            continue;
        }
        if (markup.compare(i, 2, "<!") == 0) {
            const std::size_t close = markup.find('>', i);
            const std::size_t subset = markup.find('[', i);
            if (subset != std::string_view::npos && subset < close) {
                i = skipPast(markup, skipPast(markup, subset, "]"), ">");
            } else {
                i = close == std::string_view::npos ? close : close + 1;
            }
            continue;
        }

        std::size_t end = i + 1;
        char quote = 0;
        for (; end < markup.size(); ++end) {
            const char c = markup[end];
            if (quote) {
                if (c == quote) quote = 0;
            } else if (c == '"' || c == '\'') {
                quote = c;
            } else if (c == '>') {
                break;
            }
        }
        if (end >= markup.size()) break;

        if (markup[i + 1] == '/') {
            --depth;
            if (depth == 1 && objectStart != std::string_view::npos) {
                out.push_back(markup.substr(objectStart, end + 1 - objectStart));
                objectStart = std::string_view::npos;
            }
        } else {
            std::size_t nameEnd = i + 1;
            while (nameEnd < end && !std::isspace(static_cast<unsigned char>(markup[nameEnd])) && markup[nameEnd] != '/') {
                ++nameEnd;
            }
            const bool isObject = depth == 1 && markup.substr(i + 1, nameEnd - i - 1) == "object";
            if (markup[end - 1] == '/') {
                if (isObject) out.push_back(markup.substr(i, end + 1 - i));
            } else {
                if (isObject) objectStart = i;
                ++depth;
            }
        }
        i = end + 1;
    }
    return out;
}

Fragment readFragment(xmlDoc* doc, const xmlNode* el) {
    Fragment frag{};
    const std::string tag = toString(el->name);
    frag.attributes = readAttributes(doc, el);
    if (findAttribute(frag.attributes, "Name")) {
        frag.kind = tag;
        frag.name = takeAttribute(frag.attributes, "Name");
    } else if (tag == "inventoryobject" && findAttribute(frag.attributes, "Blueprint")) {
        frag.kind = tag;
        frag.name = takeAttribute(frag.attributes, "Blueprint");
    } else if (tag.size() > 4 && tag.compare(0, 4, "xtag") == 0) {
        frag.kind = "xtag";
        frag.name = tag.substr(4);
    } else {
        frag.kind = tag;
    }
    return frag;
}

void addFragment(BlueprintRecord& record, Fragment frag) {
    for (auto& existing : record.fragments) {
        if (existing.kind == frag.kind && existing.name == frag.name) {
            // A repeated fragment refines the earlier one rather than replacing it.
            for (auto& kv : frag.attributes) setAttribute(existing.attributes, kv.first, std::move(kv.second));
            return;
        }
    }
    record.fragments.push_back(std::move(frag));
}

void fillParseError(LoadError& error, const std::string& sourceName) {
    error.kind = LoadErrorKind::MalformedSource;
    error.source = sourceName;
    const xmlError* xe = xmlGetLastError();
    if (xe) {
        error.line = xe->line;
        error.column = xe->int2;
        error.message = xe->message ? xe->message : "unparseable markup";
        while (!error.message.empty() && (error.message.back() == '\n' || error.message.back() == ' ')) {
            error.message.pop_back();
        }
    } else {
        error.message = "unparseable markup";
    }
}
}  // namespace

std::optional<std::vector<BlueprintRecord>> BlueprintLoader::parse(const std::string& markup,
                                                                   const std::string& sourceName,
                                                                   LoadError& error) {
    xmlResetLastError();
    const int options = XML_PARSE_NONET | XML_PARSE_BIG_LINES | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
    DocPtr doc(xmlReadMemory(markup.data(), static_cast<int>(markup.size()), sourceName.c_str(), "UTF-8", options),
               &xmlFreeDoc);
    if (!doc) {
        fillParseError(error, sourceName);
        logError("Blueprint parse failed: " + error.describe());
        return std::nullopt;
    }
    xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        error.kind = LoadErrorKind::MalformedSource;
        error.source = sourceName;
        error.message = "document has no root element";
        return std::nullopt;
    }

    std::vector<std::string_view> sources = objectElements(markup);
    std::size_t objectCount = 0;
    for (const xmlNode* node = root->children; node != nullptr; node = node->next) {
        if (isElement(node, "object")) ++objectCount;
    }
    // Objects produced by entity expansion have no bytes of their own; serialize every object then.
    if (sources.size() != objectCount) sources.clear();

    std::vector<BlueprintRecord> records;
    std::unordered_set<std::string> seen;
    std::size_t objectIndex = 0;
    for (xmlNode* node = root->children; node != nullptr; node = node->next) {
        if (!isElement(node, "object")) continue;
        const std::size_t sourceIndex = objectIndex++;
        BlueprintRecord record{};
        record.sourceName = sourceName;
        record.line = static_cast<int>(xmlGetLineNo(node));
        AttributeList attrs = readAttributes(doc.get(), node);
        const std::string* name = findAttribute(attrs, "Name");
        if (!name || name->empty()) {
            error.kind = LoadErrorKind::MalformedSource;
            error.source = sourceName;
            error.line = record.line;
            error.message = "object element without a Name";
            logError("Blueprint parse failed: " + error.describe());
            return std::nullopt;
        }
        record.id = *name;
        if (const std::string* parent = findAttribute(attrs, "Inherits"); parent && !parent->empty()) {
            record.parentId = *parent;
        }
        if (!seen.insert(record.id).second) {
            error.kind = LoadErrorKind::DuplicateBlueprint;
            error.source = sourceName;
            error.line = record.line;
            error.subjects = {record.id};
            error.message = "blueprint " + record.id + " is declared more than once";
            logError("Blueprint parse failed: " + error.describe());
            return std::nullopt;
        }
        for (const xmlNode* child = node->children; child != nullptr; child = child->next) {
            if (child->type != XML_ELEMENT_NODE) continue;
            addFragment(record, readFragment(doc.get(), child));
        }
        record.rawSource =
            sources.empty() ? dumpNode(doc.get(), node) : std::string(sources[sourceIndex]);
        records.push_back(std::move(record));
    }
    logDebug("Parsed " + std::to_string(records.size()) + " blueprints from " + sourceName);
    return records;
}

bool BlueprintLoader::append(std::vector<BlueprintRecord>& records,
                             std::vector<BlueprintRecord>&& incoming,
                             LoadError& error) {
    std::unordered_set<std::string> seen;
    seen.reserve(records.size() + incoming.size());
    for (const auto& r : records) seen.insert(r.id);
    for (const auto& r : incoming) {
        if (!seen.insert(r.id).second) {
            error.kind = LoadErrorKind::DuplicateBlueprint;
            error.source = r.sourceName;
            error.line = r.line;
            error.subjects = {r.id};
            error.message = "blueprint " + r.id + " is declared more than once";
            logError("Blueprint merge failed: " + error.describe());
            return false;
        }
    }
    records.reserve(records.size() + incoming.size());
    for (auto& r : incoming) records.push_back(std::move(r));
    return true;
}

}  // namespace Codex::Blueprints
