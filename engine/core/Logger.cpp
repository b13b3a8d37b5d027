#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace Codex {

namespace {
std::mutex& logMutex() {
    static std::mutex m;
    return m;
}

LogLevel& minLevelRef() {
    static LogLevel level = LogLevel::Info;
    return level;
}

Logger::Sink& sinkRef() {
    static Logger::Sink sink;
    return sink;
}

int rank(LogLevel level) { return static_cast<int>(level); }
}  // namespace

std::string_view toLabel(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARN";
        case LogLevel::Error:
        default:
            return "ERROR";
    }
}

std::optional<LogLevel> parseLogLevel(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info") return LogLevel::Info;
    if (text == "warn" || text == "warning") return LogLevel::Warning;
    if (text == "error") return LogLevel::Error;
    return std::nullopt;
}

void Logger::setMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex());
    minLevelRef() = level;
}

LogLevel Logger::minLevel() {
    std::lock_guard<std::mutex> lock(logMutex());
    return minLevelRef();
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    sinkRef() = std::move(sink);
}

void Logger::log(LogLevel level, std::string_view message) {
    using namespace std::chrono;

    std::lock_guard<std::mutex> lock(logMutex());
    if (rank(level) < rank(minLevelRef())) return;
    if (sinkRef()) {
        sinkRef()(level, message);
        return;
    }

    const auto now = system_clock::now();
    const auto t = system_clock::to_time_t(now);
    const auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << ms.count();
    std::cout << '[' << oss.str() << "] [" << toLabel(level) << "] " << message << '\n';
}

}  // namespace Codex
