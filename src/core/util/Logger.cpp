#include "softmock/core/util/Logger.h"
#include <fmt/format.h>
#include <thread>
#include <functional>
#include <cstdio>

namespace softmock::core::util {
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

void Logger::set_level(Level new_level) { current_level.store(new_level); }

std::optional<Logger::Level> Logger::parse_level(std::string_view v) {
    if (v == "trace") return Level::trace;
    if (v == "debug") return Level::debug;
    if (v == "info") return Level::info;
    if (v == "warn") return Level::warn;
    if (v == "error") return Level::error;
    if (v == "critical") return Level::critical;
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
    // short thread tag so interleaved connection logs can be told apart
    auto tid = std::hash<std::thread::id>{}(std::this_thread::get_id()) % 100000;
    std::lock_guard lock(guard);
    fmt::print("[{0}] {1} t{2:05d} {3}\n", label(level), millis, tid, message);
    std::fflush(stdout);
}

void log_debug(std::string_view message) { Logger::instance().log(Logger::Level::debug, message); }
void log_info(std::string_view message) { Logger::instance().log(Logger::Level::info, message); }
void log_warn(std::string_view message) { Logger::instance().log(Logger::Level::warn, message); }
void log_error(std::string_view message) { Logger::instance().log(Logger::Level::error, message); }
}
