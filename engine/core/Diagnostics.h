// Load failures and recoverable anomalies collected while querying blueprints.
#pragma once

#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Codex {

// Any of these aborts the whole load; a partial inheritance tree is never returned.
enum class LoadErrorKind {
    None,
    MalformedSource,
    DuplicateBlueprint,
    CyclicInheritance,
    UnresolvedParent,
    MultipleRoots,
    NoRoot
};

struct LoadError {
    LoadErrorKind kind{LoadErrorKind::None};
    std::string message;
    std::string source;  // source file name, when known
    int line{0};
    int column{0};
    // Blueprint ids involved: the duplicate, the missing parent, the cycle members, the roots.
    std::vector<std::string> subjects;

    bool failed() const { return kind != LoadErrorKind::None; }
    std::string describe() const;
};

std::string_view toLabel(LoadErrorKind kind);

enum class DiagnosticKind { PropertyType, UnresolvedPlaceholder, UnknownColorCode, MissingGlyph };

std::string_view toLabel(DiagnosticKind kind);

struct Diagnostic {
    DiagnosticKind kind{DiagnosticKind::PropertyType};
    std::string blueprint;  // id of the node being resolved, if any
    std::string subject;    // property name, placeholder token, color code or glyph path
    std::string message;
};

// Append-only anomaly list shared by concurrent readers.
class DiagnosticLog {
public:
    void add(Diagnostic d);
    std::vector<Diagnostic> snapshot() const;
    std::size_t size() const;
    std::size_t count(DiagnosticKind kind) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> entries_;
};

}  // namespace Codex
