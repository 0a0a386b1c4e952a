// common/logging.cc
#include "common/logging.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <ctime>
#include <mutex>
#include <utility>

namespace idlease {

namespace {

std::atomic<int> g_min_level {static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mu;
LogSink g_sink;  // 受 g_log_mu 保护

} // namespace

void set_log_level(LogLevel level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_min_level.load(std::memory_order_relaxed));
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> g(g_log_mu);
    g_sink = std::move(sink);
}

const char* to_string(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "debug";
    case LogLevel::INFO:  return "info";
    case LogLevel::WARN:  return "warn";
    case LogLevel::ERROR: return "error";
    }
    return "unknown";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") {
        out = LogLevel::DEBUG;
    } else if (lower == "info") {
        out = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::WARN;
    } else if (lower == "error") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void log(LogLevel level, const char* fmt, ...) {
    if (static_cast<int>(level) < g_min_level.load(std::memory_order_relaxed)) {
        return;
    }

    char line[1024];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);

    const char* prefix = nullptr;
    switch (level) {
    case LogLevel::DEBUG: prefix = "[DEBUG]"; break;
    case LogLevel::INFO:  prefix = "[INFO ]"; break;
    case LogLevel::WARN:  prefix = "[WARN ]"; break;
    case LogLevel::ERROR: prefix = "[ERROR]"; break;
    }

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf {};
    ::localtime_r(&secs, &tm_buf);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);

    // 多个 worker 线程同时写，整行加锁避免交错
    std::lock_guard<std::mutex> g(g_log_mu);
    if (g_sink) {
        g_sink(level, line);
        return;
    }
    std::fprintf(stderr, "%s.%03d %s %s\n", ts, static_cast<int>(ms), prefix, line);
}

} // namespace idlease
