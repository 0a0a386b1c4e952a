#include "server/allocator_server.h"
#include "server/server_config.h"
#include "common/logging.h"

#include <csignal>
#include <cstring>
#include <pthread.h>

int main(int argc, char** argv) {
    idlease::ServerConfig cfg;
    idlease::load_config_from_env(cfg);

    bool show_help = false;
    idlease::Status st = idlease::parse_config_args(argc, argv, cfg, show_help);
    if (!st.ok()) {
        idlease::log(idlease::LogLevel::ERROR, "%s", st.message().c_str());
        idlease::print_usage(argv[0]);
        return 1;
    }
    if (show_help) {
        idlease::print_usage(argv[0]);
        return 0;
    }
    idlease::set_log_level(cfg.log_level);

    // 在起任何线程之前屏蔽信号，由主线程 sigwait 统一处理
    sigset_t sigs;
    sigemptyset(&sigs);
    sigaddset(&sigs, SIGINT);
    sigaddset(&sigs, SIGTERM);
    int rc = ::pthread_sigmask(SIG_BLOCK, &sigs, nullptr);
    if (rc != 0) {
        idlease::log(idlease::LogLevel::ERROR, "pthread_sigmask failed: %s",
                     std::strerror(rc));
        return 1;
    }

    idlease::AllocatorServer server(cfg);
    rc = server.init();
    if (rc != 0) {
        idlease::log(idlease::LogLevel::ERROR, "server init failed rc=%d", rc);
        return 1;
    }

    rc = server.start();
    if (rc != 0) {
        idlease::log(idlease::LogLevel::ERROR, "server start failed rc=%d", rc);
        return 1;
    }

    int sig = 0;
    rc = ::sigwait(&sigs, &sig);
    if (rc != 0) {
        idlease::log(idlease::LogLevel::ERROR, "sigwait failed: %s", std::strerror(rc));
    } else {
        idlease::log(idlease::LogLevel::INFO, "received signal %d, shutting down", sig);
    }

    server.stop();
    return 0;
}
