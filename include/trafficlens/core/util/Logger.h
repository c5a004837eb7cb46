#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string_view>
#include <cstdio>
#include <utility>
#include <optional>
#include <fmt/format.h>

namespace trafficlens::core::util {
class Logger {
public:
    enum class Level { trace, debug, info, warn, error, critical };
    static Logger& instance();
    void set_level(Level new_level);
    Level level() const { return current_level.load(std::memory_order_relaxed); }
    bool enabled(Level l) const { return static_cast<int>(l) >= static_cast<int>(level()); }
    void log(Level level, std::string_view message);
    static std::optional<Level> parse_level(std::string_view name);
private:
    Logger() = default;
    std::mutex guard;
    std::atomic<Level> current_level { Level::info };
    const char* label(Level level) const;
};

void log_info(std::string_view message);

// Formatting helpers; arguments are only formatted when the level is enabled.
template <typename... Args>
void log_at(Logger::Level level, fmt::format_string<Args...> f, Args&&... args) {
    auto& lg = Logger::instance();
    if (!lg.enabled(level)) return;
    lg.log(level, fmt::format(f, std::forward<Args>(args)...));
}
template <typename... Args>
void log_trace(fmt::format_string<Args...> f, Args&&... args) { log_at(Logger::Level::trace, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) { log_at(Logger::Level::debug, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) { log_at(Logger::Level::info, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) { log_at(Logger::Level::warn, f, std::forward<Args>(args)...); }
template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) { log_at(Logger::Level::error, f, std::forward<Args>(args)...); }
}
