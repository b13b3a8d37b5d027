#include "Diagnostics.h"

#include <algorithm>
#include <sstream>

#include "Logger.h"

namespace Codex {

std::string_view toLabel(LoadErrorKind kind) {
    switch (kind) {
        case LoadErrorKind::None:
            return "None";
        case LoadErrorKind::MalformedSource:
            return "MalformedSourceError";
        case LoadErrorKind::DuplicateBlueprint:
            return "DuplicateBlueprintError";
        case LoadErrorKind::CyclicInheritance:
            return "CyclicInheritanceError";
        case LoadErrorKind::UnresolvedParent:
            return "UnresolvedParentError";
        case LoadErrorKind::MultipleRoots:
            return "MultipleRootsError";
        case LoadErrorKind::NoRoot:
        default:
            return "NoRootError";
    }
}

std::string_view toLabel(DiagnosticKind kind) {
    switch (kind) {
        case DiagnosticKind::PropertyType:
            return "PropertyTypeError";
        case DiagnosticKind::UnresolvedPlaceholder:
            return "UnresolvedPlaceholder";
        case DiagnosticKind::UnknownColorCode:
            return "UnknownColorCodeError";
        case DiagnosticKind::MissingGlyph:
        default:
            return "MissingGlyph";
    }
}

std::string LoadError::describe() const {
    std::ostringstream oss;
    oss << toLabel(kind);
    if (!source.empty()) {
        oss << " [" << source;
        if (line > 0) oss << ':' << line;
        if (column > 0) oss << ':' << column;
        oss << ']';
    }
    if (!message.empty()) oss << ": " << message;
    return oss.str();
}

void DiagnosticLog::add(Diagnostic d) {
    logWarn(std::string(toLabel(d.kind)) + " (" + d.blueprint + "): " + d.message);
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(std::move(d));
}

std::vector<Diagnostic> DiagnosticLog::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t DiagnosticLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t DiagnosticLog::count(DiagnosticKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
                                                  [kind](const Diagnostic& d) { return d.kind == kind; }));
}

void DiagnosticLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

}  // namespace Codex
