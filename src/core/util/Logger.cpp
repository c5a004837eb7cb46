#include "trafficlens/core/util/Logger.h"
#include <fmt/format.h>

namespace trafficlens::core::util {
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(Level new_level) { current_level.store(new_level, std::memory_order_relaxed); }

std::optional<Logger::Level> Logger::parse_level(std::string_view name) {
    if (name == "trace") return Level::trace;
    if (name == "debug") return Level::debug;
    if (name == "info") return Level::info;
    if (name == "warn" || name == "warning") return Level::warn;
    if (name == "error") return Level::error;
    if (name == "critical") return Level::critical;
    return std::nullopt;
}

const char* Logger::label(Level level) const {
    switch (level) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::error: return "ERROR";
        case Level::critical: return "CRIT";
    }
    return "?";
}

void Logger::log(Level level, std::string_view message) {
    if (!enabled(level)) return;
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    std::lock_guard lock(guard);
    std::FILE* out = static_cast<int>(level) >= static_cast<int>(Level::warn) ? stderr : stdout;
    fmt::print(out, "[{0}] {1} {2}\n", label(level), millis, message);
    std::fflush(out);
}

void log_info(std::string_view message) { Logger::instance().log(Logger::Level::info, message); }
}
