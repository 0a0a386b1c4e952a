#include "server/server_config.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

using namespace idlease;

namespace {

class ServerConfigTest : public ::testing::Test {
protected:
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }

    static void clear_env() {
        for (const char* name : {"BIND", "PORT", "MIN", "MAX", "TIMEOUT", "LOG_LEVEL"}) {
            ::unsetenv(name);
        }
    }

    Status parse(std::vector<std::string> args, ServerConfig& cfg, bool& help) {
        args.insert(args.begin(), "idlease_serverd");
        args_ = std::move(args);
        argv_.clear();
        for (auto& a : args_) {
            argv_.push_back(&a[0]);
        }
        return parse_config_args(static_cast<int>(argv_.size()), argv_.data(), cfg, help);
    }

    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

} // namespace

TEST_F(ServerConfigTest, Defaults) {
    ServerConfig cfg;
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.bind, "0.0.0.0");
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.pool.min_id, 1u);
    EXPECT_EQ(cfg.pool.max_id, 65535u);
    EXPECT_EQ(cfg.pool.timeout_ms, 3000);
    EXPECT_EQ(cfg.log_level, LogLevel::INFO);
    EXPECT_TRUE(validate_config(cfg).ok());
}

TEST_F(ServerConfigTest, ReadsEnvironment) {
    ::setenv("BIND", "127.0.0.1", 1);
    ::setenv("PORT", "4100", 1);
    ::setenv("MIN", "10", 1);
    ::setenv("MAX", "20", 1);
    ::setenv("TIMEOUT", "500", 1);
    ::setenv("LOG_LEVEL", "DEBUG", 1);

    ServerConfig cfg;
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.bind, "127.0.0.1");
    EXPECT_EQ(cfg.port, 4100);
    EXPECT_EQ(cfg.pool.min_id, 10u);
    EXPECT_EQ(cfg.pool.max_id, 20u);
    EXPECT_EQ(cfg.pool.timeout_ms, 500);
    EXPECT_EQ(cfg.log_level, LogLevel::DEBUG);
}

TEST_F(ServerConfigTest, InvalidEnvironmentFallsBackToDefault) {
    ::setenv("PORT", "not-a-port", 1);
    ::setenv("MAX", "12abc", 1);
    ::setenv("TIMEOUT", "", 1);
    ::setenv("LOG_LEVEL", "loud", 1);

    ServerConfig cfg;
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.port, 3000);
    EXPECT_EQ(cfg.pool.max_id, 65535u);
    EXPECT_EQ(cfg.pool.timeout_ms, 3000);
    EXPECT_EQ(cfg.log_level, LogLevel::INFO);
}

TEST_F(ServerConfigTest, FlagsOverrideEnvironment) {
    ::setenv("PORT", "4100", 1);
    ::setenv("MAX", "20", 1);

    ServerConfig cfg;
    load_config_from_env(cfg);
    bool help = false;
    ASSERT_TRUE(parse({"--port", "5000", "--max", "3", "--timeout", "2000",
                       "--log-level", "warn"}, cfg, help).ok());
    EXPECT_FALSE(help);
    EXPECT_EQ(cfg.port, 5000);
    EXPECT_EQ(cfg.pool.min_id, 1u);
    EXPECT_EQ(cfg.pool.max_id, 3u);
    EXPECT_EQ(cfg.pool.timeout_ms, 2000);
    EXPECT_EQ(cfg.log_level, LogLevel::WARN);
}

TEST_F(ServerConfigTest, BadFlagsAreErrors) {
    ServerConfig cfg;
    bool help = false;
    EXPECT_EQ(parse({"--port", "70000"}, cfg, help).code(), Status::kInvalidArgument);
    EXPECT_EQ(parse({"--min", "-1"}, cfg, help).code(), Status::kInvalidArgument);
    EXPECT_EQ(parse({"--timeout"}, cfg, help).code(), Status::kInvalidArgument);
    EXPECT_EQ(parse({"--frobnicate", "1"}, cfg, help).code(), Status::kInvalidArgument);
}

TEST_F(ServerConfigTest, Help) {
    ServerConfig cfg;
    bool help = false;
    ASSERT_TRUE(parse({"--help"}, cfg, help).ok());
    EXPECT_TRUE(help);
}

TEST_F(ServerConfigTest, Validation) {
    ServerConfig cfg;
    cfg.pool.min_id = 5;
    cfg.pool.max_id = 4;
    EXPECT_EQ(validate_config(cfg).code(), Status::kInvalidArgument);

    cfg.pool.max_id = 5;
    EXPECT_TRUE(validate_config(cfg).ok());

    cfg.pool.timeout_ms = 0;
    EXPECT_EQ(validate_config(cfg).code(), Status::kInvalidArgument);
}

TEST_F(ServerConfigTest, OverflowingTimeoutFromEnvFailsValidation) {
    ::setenv("TIMEOUT", "9223372036854775807", 1);

    ServerConfig cfg;
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.pool.timeout_ms, 9223372036854775807LL);
    EXPECT_EQ(validate_config(cfg).code(), Status::kInvalidArgument);

    cfg.pool.timeout_ms = 86400000;
    EXPECT_TRUE(validate_config(cfg).ok());
}

TEST_F(ServerConfigTest, FullIdRangeFailsValidation) {
    ::setenv("MIN", "0", 1);
    ::setenv("MAX", "4294967295", 1);

    ServerConfig cfg;
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.pool.min_id, 0u);
    EXPECT_EQ(cfg.pool.max_id, 4294967295u);
    EXPECT_EQ(validate_config(cfg).code(), Status::kInvalidArgument);
}

TEST_F(ServerConfigTest, PortZeroOnlyProgrammatically) {
    ServerConfig cfg;
    bool help = false;
    EXPECT_EQ(parse({"--port", "0"}, cfg, help).code(), Status::kInvalidArgument);

    ::setenv("PORT", "0", 1);
    load_config_from_env(cfg);
    EXPECT_EQ(cfg.port, 3000);

    cfg.port = 0;
    EXPECT_TRUE(validate_config(cfg).ok());

    cfg.bind.clear();
    EXPECT_EQ(validate_config(cfg).code(), Status::kInvalidArgument);
}

TEST(LogLevelTest, Parse) {
    LogLevel lv = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("error", lv));
    EXPECT_EQ(lv, LogLevel::ERROR);
    EXPECT_TRUE(parse_log_level("Warning", lv));
    EXPECT_EQ(lv, LogLevel::WARN);
    EXPECT_FALSE(parse_log_level("verbose", lv));
    EXPECT_EQ(lv, LogLevel::WARN);
    EXPECT_STREQ(to_string(LogLevel::DEBUG), "debug");
}
