#ifndef LENDX_LOG_HPP
#define LENDX_LOG_HPP

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string_view>

namespace lendx {

namespace log {

enum class Level : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// "trace" | "debug" | "info" | "warn" | "error" | "off"
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level level);

// =============================================================================
// Logger - leveled line logger over an ostream sink
// =============================================================================

class Logger {
public:
    explicit Logger(Level level = Level::INFO, std::ostream* sink = &std::cerr)
        : level_(level), sink_(sink) {}

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_level(Level level) { level_.store(level, std::memory_order_relaxed); }
    Level level() const { return level_.load(std::memory_order_relaxed); }

    void set_sink(std::ostream* sink) {
        std::lock_guard lock(mutex_);
        sink_ = sink;
    }

    bool enabled(Level level) const {
        return level != Level::OFF && level >= this->level();
    }

    template <typename... Args>
    void write(Level level, std::string_view component, const Args&... args) {
        if (!enabled(level)) return;
        std::ostringstream line;
        line << "[" << level_name(level) << "] " << component << ": ";
        (line << ... << args);
        line << "\n";

        std::lock_guard lock(mutex_);
        if (sink_) {
            *sink_ << line.str();
            sink_->flush();
        }
    }

    template <typename... Args>
    void debug(std::string_view component, const Args&... args) {
        write(Level::DEBUG, component, args...);
    }

    template <typename... Args>
    void info(std::string_view component, const Args&... args) {
        write(Level::INFO, component, args...);
    }

    template <typename... Args>
    void warn(std::string_view component, const Args&... args) {
        write(Level::WARN, component, args...);
    }

    template <typename... Args>
    void error(std::string_view component, const Args&... args) {
        write(Level::ERROR, component, args...);
    }

private:
    std::atomic<Level> level_;
    std::ostream* sink_;
    std::mutex mutex_;
};

} // namespace log

} // namespace lendx

#endif // LENDX_LOG_HPP
