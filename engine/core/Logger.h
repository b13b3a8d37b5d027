// Console logger with a level filter and a swappable sink.
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace Codex {

enum class LogLevel { Debug, Info, Warning, Error };

class Logger {
public:
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static void log(LogLevel level, std::string_view message);

    static void setMinLevel(LogLevel level);
    static LogLevel minLevel();

    // Replaces stdout output; pass an empty function to restore it.
    static void setSink(Sink sink);
};

// Accepts "debug", "info", "warn"/"warning", "error" (case-sensitive).
std::optional<LogLevel> parseLogLevel(std::string_view text);
std::string_view toLabel(LogLevel level);

inline void logDebug(std::string_view msg) { Logger::log(LogLevel::Debug, msg); }
inline void logInfo(std::string_view msg) { Logger::log(LogLevel::Info, msg); }
inline void logWarn(std::string_view msg) { Logger::log(LogLevel::Warning, msg); }
inline void logError(std::string_view msg) { Logger::log(LogLevel::Error, msg); }

}  // namespace Codex
