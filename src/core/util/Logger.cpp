#include "eventtap/core/util/Logger.h"
#include <fmt/format.h>

namespace eventtap::core::util {
Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::~Logger() {
    if (file) std::fclose(file);
}

void Logger::set_level(Level new_level) { current_level.store(new_level, std::memory_order_relaxed); }

bool Logger::set_file(const std::string& path) {
    std::lock_guard lock(guard);
    if (file) { std::fclose(file); file = nullptr; }
    if (path.empty()) return true;
    file = std::fopen(path.c_str(), "a");
    return file != nullptr;
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
    fmt::print("[{0}] {1} {2}\n", label(level), millis, message);
    if (file) {
        fmt::print(file, "[{0}] {1} {2}\n", label(level), millis, message);
        std::fflush(file);
    }
}

Logger::Level parse_level(std::string_view v) {
    if (v == "trace") return Logger::Level::trace;
    if (v == "debug") return Logger::Level::debug;
    if (v == "info") return Logger::Level::info;
    if (v == "warn") return Logger::Level::warn;
    if (v == "error") return Logger::Level::error;
    if (v == "critical") return Logger::Level::critical;
    return Logger::Level::info;
}

void log_debug(std::string_view message) { Logger::instance().log(Logger::Level::debug, message); }
void log_info(std::string_view message) { Logger::instance().log(Logger::Level::info, message); }
void log_warn(std::string_view message) { Logger::instance().log(Logger::Level::warn, message); }
void log_error(std::string_view message) { Logger::instance().log(Logger::Level::error, message); }
}
