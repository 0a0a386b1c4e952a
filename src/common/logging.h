// common/logging.h
#pragma once

#include <cstdio>
#include <functional>
#include <string>

namespace idlease {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
};

void log(LogLevel level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

// 低于该级别的日志直接丢弃，默认 INFO
void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" / "info" / "warn" / "error"，大小写不敏感
bool parse_log_level(const std::string& s, LogLevel& out);
const char* to_string(LogLevel level);

// 设置后日志行（不含时间和级别前缀）交给 sink，不再写 stderr；传空恢复 stderr
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

} // namespace idlease
