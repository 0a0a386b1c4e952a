// server/server_config.h
#pragma once

#include <cstdint>
#include <string>

#include "common/logging.h"
#include "common/status.h"
#include "core/lease/id_allocator.h"

namespace idlease {

struct ServerConfig {
    std::string bind {"0.0.0.0"};
    std::uint16_t port {3000};  // 0 表示由内核分配，启动后看 AllocatorServer::port()

    AllocatorOptions pool;

    LogLevel log_level {LogLevel::INFO};
};

// 从环境变量读取：BIND PORT MIN MAX TIMEOUT LOG_LEVEL
// 解析失败的值保留默认值并打 WARN
void load_config_from_env(ServerConfig& cfg);

// 命令行覆盖环境变量：--bind --port --min --max --timeout --log-level
// 未知参数或解析失败返回 InvalidArgument；--help 时 show_help 置 true
Status parse_config_args(int argc, char** argv, ServerConfig& cfg, bool& show_help);

Status validate_config(const ServerConfig& cfg);

void print_usage(const char* prog);

} // namespace idlease
