// =============================================================================
// log.cpp - Leveled logging with a replaceable sink
// =============================================================================

#include "kald/log.hpp"
#include "kald/types.hpp"

#include <cstdio>
#include <mutex>

namespace kald {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "?";
}

std::optional<LogLevel> parse_log_level(std::string_view text) {
    if (text == "trace") return LogLevel::TRACE;
    if (text == "debug") return LogLevel::DEBUG;
    if (text == "info") return LogLevel::INFO;
    if (text == "warn" || text == "warning") return LogLevel::WARN;
    if (text == "error") return LogLevel::ERROR;
    if (text == "fatal") return LogLevel::FATAL;
    if (text == "off") return LogLevel::OFF;
    return std::nullopt;
}

namespace logging {

namespace {

std::atomic<LogLevel> g_threshold{LogLevel::INFO};

// Sink replacement and writes are serialized so lines never interleave
std::mutex g_sink_mutex;
Sink g_sink;

void write_stderr(LogLevel level, std::string_view component, std::string_view message) {
    TimestampMs now = wall_clock_ms();
    std::string line = fmt::format("{}.{:03d} {:<5} [{}] {}\n",
                                   now / 1000, static_cast<int>(now % 1000),
                                   to_string(level), component, message);
    std::fwrite(line.data(), 1, line.size(), stderr);
}

} // namespace

void set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void set_threshold(LogLevel level) {
    g_threshold.store(level, std::memory_order_relaxed);
}

LogLevel threshold() {
    return g_threshold.load(std::memory_order_relaxed);
}

void write(LogLevel level, std::string_view component, std::string_view message) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, component, message);
    } else {
        write_stderr(level, component, message);
    }
}

} // namespace logging

} // namespace kald
