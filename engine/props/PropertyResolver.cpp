#include "PropertyResolver.h"

#include <algorithm>
#include <utility>

#include "../core/Logger.h"
#include "TextSubstitution.h"

namespace Codex::Props {

namespace {
// Properties being computed on this thread, to stop definitions that depend on each other.
thread_local std::vector<std::pair<std::size_t, std::string>> inFlight;

struct InFlightGuard {
    InFlightGuard(std::size_t slot, const std::string& name) { inFlight.emplace_back(slot, name); }
    ~InFlightGuard() { inFlight.pop_back(); }
};

bool isInFlight(std::size_t slot, const std::string& name) {
    return std::any_of(inFlight.begin(), inFlight.end(),
                       [&](const auto& entry) { return entry.first == slot && entry.second == name; });
}

std::string path(const std::string& kind, const std::string& name, const std::string& attr) {
    return kind + "." + name + "." + attr;
}
}  // namespace

std::string_view toLabel(PropertyStatus status) {
    switch (status) {
        case PropertyStatus::Ok:
            return "Ok";
        case PropertyStatus::Absent:
            return "Absent";
        case PropertyStatus::TypeError:
            return "PropertyTypeError";
        case PropertyStatus::UnknownProperty:
        default:
            return "UnknownPropertyError";
    }
}

// ---- PropertyContext ------------------------------------------------------

const BlueprintTree& PropertyContext::tree() const { return resolver_.tree(); }

const CodexConfig& PropertyContext::config() const { return resolver_.config(); }

const std::string* PropertyContext::raw(const std::string& kind,
                                        const std::string& name,
                                        const std::string& attr) const {
    return table_.value(kind, name, attr);
}

bool PropertyContext::has(const std::string& kind, const std::string& name) const {
    return table_.find(kind, name) != nullptr;
}

bool PropertyContext::isSpecified(const std::string& kind, const std::string& name) const {
    return node_.record().findFragment(kind, name) != nullptr;
}

bool PropertyContext::isSpecified(const std::string& kind, const std::string& name, const std::string& attr) const {
    const auto* f = node_.record().findFragment(kind, name);
    return f && Blueprints::findAttribute(f->attributes, attr) != nullptr;
}

bool PropertyContext::inheritsFrom(const std::string& id) const {
    return BlueprintTree::inheritsFrom(node_, id);
}

bool PropertyContext::inheritsFromAny(std::initializer_list<const char*> ids) const {
    for (const char* id : ids) {
        if (BlueprintTree::inheritsFrom(node_, id)) return true;
    }
    return false;
}

std::optional<int> PropertyContext::integer(const std::string& kind,
                                            const std::string& name,
                                            const std::string& attr) {
    const std::string* v = raw(kind, name, attr);
    if (!v) return std::nullopt;
    return toInt(*v, path(kind, name, attr));
}

std::optional<double> PropertyContext::decimal(const std::string& kind,
                                               const std::string& name,
                                               const std::string& attr) {
    const std::string* v = raw(kind, name, attr);
    if (!v) return std::nullopt;
    auto parsed = parseDecimal(*v);
    if (!parsed) typeError(path(kind, name, attr) + " value '" + *v + "' is not a number");
    return parsed;
}

std::optional<bool> PropertyContext::boolean(const std::string& kind,
                                             const std::string& name,
                                             const std::string& attr) {
    const std::string* v = raw(kind, name, attr);
    if (!v) return std::nullopt;
    auto parsed = parseBool(*v);
    if (!parsed) typeError(path(kind, name, attr) + " value '" + *v + "' is not a boolean");
    return parsed;
}

std::optional<int> PropertyContext::toInt(const std::string& rawValue, const std::string& what) {
    auto parsed = parseInt(rawValue);
    if (!parsed) typeError(what + " value '" + rawValue + "' is not an integer");
    return parsed;
}

std::optional<PropertyValue> PropertyContext::property(const std::string& name) {
    PropertyResult r = resolver_.resolve(node_, name);
    if (!r.ok()) return std::nullopt;
    return r.value;
}

PropertyResult PropertyContext::resolveOn(const BlueprintNode& other, const std::string& name) {
    return resolver_.resolve(other, name);
}

const BlueprintNode* PropertyContext::lookup(const std::string& id) const {
    return resolver_.tree().index().find(id);
}

const GenderDef* PropertyContext::gender() const {
    const CodexConfig& cfg = resolver_.config();
    if (const std::string* g = raw("tag", "Gender", "Value"); g && !g->empty()) {
        if (const GenderDef* def = cfg.findGender(*g)) return def;
    }
    return cfg.findGender(cfg.defaultGender);
}

std::string PropertyContext::substitute(const std::string& text) {
    std::string subjectName = id();
    if (property_ != "displayname" && resolver_.registry().contains("displayname")) {
        if (auto name = property("displayname")) {
            if (const auto* s = std::get_if<std::string>(&*name); s && !s->empty()) subjectName = *s;
        }
    }
    SubstitutionResult result = substitutePlaceholders(text, gender(), subjectName);
    for (const auto& token : result.unresolved) {
        note(DiagnosticKind::UnresolvedPlaceholder, token, "placeholder left unresolved in " + property_);
    }
    return std::move(result.text);
}

void PropertyContext::typeError(const std::string& message) {
    // First failure wins; later ones are usually consequences of it.
    if (typeError_.empty()) typeError_ = message;
}

void PropertyContext::note(DiagnosticKind kind, const std::string& subject, const std::string& message) {
    resolver_.diagnostics().add(Diagnostic{kind, id(), subject, message});
}

// ---- PropertyResolver -----------------------------------------------------

PropertyResolver::PropertyResolver(const BlueprintTree& tree,
                                   const PropertyRegistry& registry,
                                   const CodexConfig& config,
                                   DiagnosticLog& diagnostics)
    : tree_(tree),
      registry_(registry),
      config_(config),
      diagnostics_(diagnostics),
      tables_(tree.size()),
      results_(tree.size()) {}

const FragmentTable& PropertyResolver::fragments(const BlueprintNode& node) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    if (const auto& cached = tables_[node.slot()]) return *cached;

    // Walk up to the nearest merged ancestor, then fold back down.
    std::vector<const BlueprintNode*> pending;
    const FragmentTable* base = nullptr;
    for (const BlueprintNode* n = &node; n != nullptr; n = n->parent()) {
        if (tables_[n->slot()]) {
            base = tables_[n->slot()].get();
            break;
        }
        pending.push_back(n);
    }
    static const FragmentTable kEmpty{};
    for (auto it = pending.rbegin(); it != pending.rend(); ++it) {
        auto merged = std::make_unique<const FragmentTable>(mergeStep(base ? *base : kEmpty, (*it)->record()));
        base = merged.get();
        tables_[(*it)->slot()] = std::move(merged);
        ++mergeCount_;
    }
    return *base;
}

PropertyResult PropertyResolver::resolve(const std::string& id, const std::string& name) const {
    const BlueprintNode* node = tree_.index().find(id);
    if (!node) {
        PropertyResult r;
        r.status = PropertyStatus::Absent;
        r.message = "no blueprint named " + id;
        return r;
    }
    return resolve(*node, name);
}

PropertyResult PropertyResolver::resolve(const BlueprintNode& node, const std::string& name) const {
    {
        std::lock_guard<std::mutex> lock(resultMutex_);
        auto& cache = results_[node.slot()];
        auto it = cache.find(name);
        if (it != cache.end()) return it->second;
    }

    if (!registry_.contains(name) && name.find('.') == std::string::npos) {
        // Not cached: a bad name is the caller's mistake, not a property of the node.
        PropertyResult r;
        r.status = PropertyStatus::UnknownProperty;
        r.message = "unknown property " + name;
        logWarn("Unknown property requested on " + node.id() + ": " + name);
        return r;
    }

    if (isInFlight(node.slot(), name)) {
        PropertyResult r;
        r.status = PropertyStatus::Absent;
        r.message = "property " + name + " depends on itself";
        logWarn("Cyclic property dependency on " + node.id() + ": " + name);
        return r;
    }

    PropertyResult computed;
    {
        InFlightGuard guard(node.slot(), name);
        computed = compute(node, name);
    }

    std::lock_guard<std::mutex> lock(resultMutex_);
    // Another reader may have stored first; keep that copy so every caller sees one value.
    auto inserted = results_[node.slot()].emplace(name, std::move(computed));
    return inserted.first->second;
}

PropertyResult PropertyResolver::compute(const BlueprintNode& node, const std::string& name) const {
    ++computeCount_;
    const PropertyDef* def = registry_.find(name);
    if (!def) return resolvePath(node, name);

    PropertyContext ctx(*this, node, fragments(node), name);
    std::optional<PropertyValue> value = def->compute(ctx);

    bool mistyped = ctx.hasTypeError();
    std::string typeError = ctx.typeErrorMessage();
    if (!mistyped && value && typeOf(*value) != def->type) {
        mistyped = true;
        typeError = name + " returned " + std::string(toLabel(typeOf(*value))) + ", declared " +
                    std::string(toLabel(def->type));
    }

    PropertyResult r;
    if (mistyped) {
        r.status = PropertyStatus::TypeError;
        r.value = def->fallback;
        r.defaulted = true;
        r.message = std::move(typeError);
        diagnostics_.add(Diagnostic{DiagnosticKind::PropertyType, node.id(), name, r.message});
    } else if (value) {
        r.status = PropertyStatus::Ok;
        r.value = std::move(value);
    } else if (def->fallback) {
        r.status = PropertyStatus::Ok;
        r.value = def->fallback;
        r.defaulted = true;
    } else {
        r.status = PropertyStatus::Absent;
    }
    return r;
}

PropertyResult PropertyResolver::resolvePath(const BlueprintNode& node, const std::string& path) const {
    const FragmentTable& table = fragments(node);
    const std::size_t first = path.find('.');
    const std::size_t last = path.rfind('.');
    const std::string kind = path.substr(0, first);

    PropertyResult r;
    if (first == last) {
        r.status = PropertyStatus::Ok;
        r.value = table.find(kind, path.substr(first + 1)) != nullptr;
        return r;
    }
    const std::string name = path.substr(first + 1, last - first - 1);
    const std::string attr = path.substr(last + 1);
    if (const std::string* v = table.value(kind, name, attr)) {
        r.status = PropertyStatus::Ok;
        r.value = *v;
    } else {
        r.status = PropertyStatus::Absent;
    }
    return r;
}

}  // namespace Codex::Props
