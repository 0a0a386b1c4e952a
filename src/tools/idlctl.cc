// src/tools/idlctl.cc
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "rpc/reply_format.h"
#include "rpc/rpc_client.h"
#include "idlease.pb.h"
#include "common/logging.h"

using idlease::rpc::RpcClient;

static void usage() {
    std::fprintf(stderr,
        "Usage:\n"
        "  idlctl [--host HOST] [--port PORT] [--json] <command> [args...]\n"
        "\n"
        "Commands:\n"
        "  acquire\n"
        "  heartbeat <id>\n"
        "\n"
        "Default host=127.0.0.1, port=3000\n"
        "Exit code: 0 lease granted, 2 error payload, 1 transport/usage error\n");
}

// --json 时按对外 JSON 形状输出：{"id":..,"exp":..} 或 {"error":{"code":..,"msg":".."}}
static int print_reply(const idlease::wire::LeaseReply& rsp, bool json) {
    if (rsp.has_grant()) {
        const auto& g = rsp.grant();
        if (json) {
            std::printf("%s\n", idlease::format_reply_json(rsp).c_str());
        } else {
            std::printf("id=%u exp=%lld\n", g.id(), static_cast<long long>(g.exp()));
        }
        return 0;
    }
    if (rsp.has_error()) {
        const auto& e = rsp.error();
        if (json) {
            std::printf("%s\n", idlease::format_reply_json(rsp).c_str());
        } else {
            std::fprintf(stderr, "error: code=%d msg=%s\n", e.code(), e.msg().c_str());
        }
        return 2;
    }
    std::fprintf(stderr, "empty reply from server\n");
    return 1;
}

// 简单 argv 解析
int main(int argc, char** argv) {
    std::string host = "127.0.0.1";
    uint16_t port = 3000;
    bool json = false;

    int idx = 1;
    while (idx < argc && std::strncmp(argv[idx], "--", 2) == 0) {
        std::string opt = argv[idx];
        if (opt == "--host" && idx + 1 < argc) {
            host = argv[++idx];
        } else if (opt == "--port" && idx + 1 < argc) {
            char* end = nullptr;
            errno = 0;
            long v = std::strtol(argv[++idx], &end, 10);
            if (errno != 0 || *end != '\0' || v < 1 || v > 65535) {
                std::fprintf(stderr, "invalid port: %s\n", argv[idx]);
                return 1;
            }
            port = static_cast<uint16_t>(v);
        } else if (opt == "--json") {
            json = true;
        } else {
            usage();
            return 1;
        }
        ++idx;
    }

    if (idx >= argc) {
        usage();
        return 1;
    }

    std::string cmd = argv[idx++];

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    RpcClient client(host, port);
    if (!client.connect()) {
        std::fprintf(stderr, "failed to connect to %s:%u\n", host.c_str(), port);
        return 1;
    }

    idlease::wire::LeaseReply rsp;
    if (cmd == "acquire") {
        idlease::wire::AcquireRequest req;
        if (!client.Acquire(req, rsp)) {
            std::fprintf(stderr, "Acquire RPC failed\n");
            return 1;
        }
    } else if (cmd == "heartbeat") {
        if (idx >= argc) {
            usage();
            return 1;
        }
        char* end = nullptr;
        errno = 0;
        unsigned long id = std::strtoul(argv[idx], &end, 10);
        if (argv[idx][0] == '-' || errno != 0 || *end != '\0' || id > 0xFFFFFFFFul) {
            std::fprintf(stderr, "invalid id: %s\n", argv[idx]);
            return 1;
        }
        ++idx;

        idlease::wire::HeartbeatRequest req;
        req.set_id(static_cast<uint32_t>(id));
        if (!client.Heartbeat(req, rsp)) {
            std::fprintf(stderr, "Heartbeat RPC failed\n");
            return 1;
        }
    } else {
        usage();
        return 1;
    }

    return print_reply(rsp, json);
}
