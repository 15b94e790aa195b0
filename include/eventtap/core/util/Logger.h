#pragma once
#include <string>
#include <mutex>
#include <atomic>
#include <chrono>
#include <string_view>
#include <cstdio>

namespace eventtap::core::util {
class Logger {
public:
    enum class Level { trace, debug, info, warn, error, critical };
    static Logger& instance();
    void set_level(Level new_level);
    Level level() const { return current_level.load(std::memory_order_relaxed); }
    bool enabled(Level level) const { return static_cast<int>(level) >= static_cast<int>(this->level()); }
    // Mirror every line into a file as well as stdout. Empty path closes the file.
    bool set_file(const std::string& path);
    void log(Level level, std::string_view message);
private:
    Logger() = default;
    ~Logger();
    std::mutex guard;
    // read on every log call from the session threads without taking guard
    std::atomic<Level> current_level { Level::info };
    std::FILE* file { nullptr };
    const char* label(Level level) const;
};
Logger::Level parse_level(std::string_view v);
void log_debug(std::string_view message);
void log_info(std::string_view message);
void log_warn(std::string_view message);
void log_error(std::string_view message);
}
