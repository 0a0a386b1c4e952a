// server/server_config.cc
#include "server/server_config.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace idlease {

namespace {

// 整行都是合法整数才算成功，不接受 "12abc"
bool parse_int64(const char* s, long long& out) {
    if (s == nullptr || *s == '\0') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (errno != 0 || end == s || *end != '\0') {
        return false;
    }
    out = v;
    return true;
}

bool parse_port(const char* s, std::uint16_t& out) {
    long long v = 0;
    if (!parse_int64(s, v) || v < 1 || v > 65535) {
        return false;
    }
    out = static_cast<std::uint16_t>(v);
    return true;
}

bool parse_id(const char* s, LeaseId& out) {
    long long v = 0;
    if (!parse_int64(s, v) || v < 0 ||
        v > static_cast<long long>(std::numeric_limits<LeaseId>::max())) {
        return false;
    }
    out = static_cast<LeaseId>(v);
    return true;
}

bool parse_timeout(const char* s, DurationMs& out) {
    long long v = 0;
    if (!parse_int64(s, v)) {
        return false;
    }
    out = static_cast<DurationMs>(v);
    return true;
}

template <typename T, typename Parser>
void env_var_parse(const char* name, T& value, Parser parse) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return;
    }
    T parsed = value;
    if (!parse(raw, parsed)) {
        log(LogLevel::WARN, "config: ignoring invalid %s=%s", name, raw);
        return;
    }
    value = parsed;
}

} // namespace

void load_config_from_env(ServerConfig& cfg) {
    if (const char* bind = std::getenv("BIND")) {
        if (*bind != '\0') {
            cfg.bind = bind;
        }
    }
    env_var_parse("PORT", cfg.port, parse_port);
    env_var_parse("MIN", cfg.pool.min_id, parse_id);
    env_var_parse("MAX", cfg.pool.max_id, parse_id);
    env_var_parse("TIMEOUT", cfg.pool.timeout_ms, parse_timeout);
    env_var_parse("LOG_LEVEL", cfg.log_level,
                  [](const char* s, LogLevel& out) { return parse_log_level(s, out); });
}

Status parse_config_args(int argc, char** argv, ServerConfig& cfg, bool& show_help) {
    show_help = false;

    int idx = 1;
    while (idx < argc) {
        std::string opt = argv[idx];
        if (opt == "-h" || opt == "--help") {
            show_help = true;
            return Status::OK();
        }
        if (idx + 1 >= argc) {
            return Status::InvalidArgument("missing value for " + opt);
        }
        const char* val = argv[++idx];

        bool ok = true;
        if (opt == "--bind") {
            cfg.bind = val;
            ok = !cfg.bind.empty();
        } else if (opt == "--port") {
            ok = parse_port(val, cfg.port);
        } else if (opt == "--min") {
            ok = parse_id(val, cfg.pool.min_id);
        } else if (opt == "--max") {
            ok = parse_id(val, cfg.pool.max_id);
        } else if (opt == "--timeout") {
            ok = parse_timeout(val, cfg.pool.timeout_ms);
        } else if (opt == "--log-level") {
            ok = parse_log_level(val, cfg.log_level);
        } else {
            return Status::InvalidArgument("unknown option " + opt);
        }
        if (!ok) {
            return Status::InvalidArgument("invalid value for " + opt + ": " + val);
        }
        ++idx;
    }
    return Status::OK();
}

Status validate_config(const ServerConfig& cfg) {
    // port 0 只能由代码设置（env 和命令行只接受 1..65535），表示由内核分配
    if (cfg.bind.empty()) {
        return Status::InvalidArgument("bind address is empty");
    }
    return IdAllocator::validate(cfg.pool);
}

void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s [--bind ADDR] [--port PORT] [--min ID] [--max ID]\n"
        "     [--timeout MS] [--log-level debug|info|warn|error]\n"
        "\n"
        "Environment: BIND PORT MIN MAX TIMEOUT LOG_LEVEL (flags take precedence)\n"
        "Defaults: bind=0.0.0.0 port=3000 min=1 max=65535 timeout=3000 log-level=info\n",
        prog);
}

} // namespace idlease
