#ifndef KALD_LOG_HPP
#define KALD_LOG_HPP

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace kald {

// =============================================================================
// Log Levels
// =============================================================================

enum class LogLevel : uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

const char* to_string(LogLevel level);
std::optional<LogLevel> parse_log_level(std::string_view text);

// =============================================================================
// Log Sink (process-wide output target)
// =============================================================================

namespace logging {

using Sink = std::function<void(LogLevel, std::string_view component, std::string_view message)>;

// Replace the output sink. Passing an empty function restores stderr.
void set_sink(Sink sink);

void set_threshold(LogLevel level);
LogLevel threshold();

void write(LogLevel level, std::string_view component, std::string_view message);

} // namespace logging

// =============================================================================
// Journal - named logger for one component
// =============================================================================

class Journal {
public:
    explicit Journal(std::string component) : component_(std::move(component)) {}

    bool enabled(LogLevel level) const {
        return level >= logging::threshold();
    }

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) const {
        if (!enabled(level)) return;
        logging::write(level, component_, fmt::format(format, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::TRACE, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::DEBUG, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::INFO, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::WARN, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::ERROR, format, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void fatal(fmt::format_string<Args...> format, Args&&... args) const {
        log(LogLevel::FATAL, format, std::forward<Args>(args)...);
    }

    const std::string& component() const { return component_; }

private:
    std::string component_;
};

} // namespace kald

#endif // KALD_LOG_HPP
