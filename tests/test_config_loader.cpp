#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "config/config_loader.hpp"

using katabox::config::ApplyConfigFromEnv;
using katabox::config::ApplyConfigFromJson;
using katabox::config::Config;

class ConfigLoaderTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& name : touched_) {
            ::unsetenv(name.c_str());
        }
        if (!temp_file_.empty()) {
            std::remove(temp_file_.c_str());
        }
    }

    void SetEnv(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
        touched_.push_back(name);
    }

    std::string WriteTempFile(const std::string& contents) {
        temp_file_ = "/tmp/katabox-config-test-" + std::to_string(::getpid()) + ".json";
        std::ofstream out(temp_file_);
        out << contents;
        return temp_file_;
    }

    std::vector<std::string> touched_;
    std::string temp_file_;
};

TEST_F(ConfigLoaderTest, DefaultsMatchDocumentedValues) {
    const Config config{};
    EXPECT_EQ(config.sandbox.limits.timeout_ms, 10000);
    EXPECT_EQ(config.sandbox.limits.memory_mb, 64);
    EXPECT_EQ(config.sandbox.limits.max_output_bytes, 1024 * 1024);
    EXPECT_EQ(config.sandbox.launch.interpreter, "node");
    EXPECT_EQ(config.sandbox.launch.memory_flag_prefix, "--max-old-space-size=");
    EXPECT_EQ(config.server.port, 6001);
    EXPECT_EQ(config.log.level, "info");
}

TEST_F(ConfigLoaderTest, AppliesJsonSections) {
    Config config{};
    const auto data = nlohmann::json::parse(R"({
        "sandbox": {
            "timeoutMs": 2500,
            "memoryMb": 128,
            "maxOutputBytes": 4096,
            "interpreter": "/usr/bin/node",
            "extraArgs": ["--input-type=module", "-"],
            "homeDir": "/var/empty"
        },
        "pool": {"maxConcurrent": 2, "maxQueue": 0},
        "server": {"host": "127.0.0.1", "port": 7001},
        "log": {"level": "DEBUG"}
    })");
    ApplyConfigFromJson(config, data);

    EXPECT_EQ(config.sandbox.limits.timeout_ms, 2500);
    EXPECT_EQ(config.sandbox.limits.memory_mb, 128);
    EXPECT_EQ(config.sandbox.limits.max_output_bytes, 4096);
    EXPECT_EQ(config.sandbox.launch.interpreter, "/usr/bin/node");
    EXPECT_EQ(config.sandbox.launch.home_dir, "/var/empty");
    EXPECT_EQ(config.pool.max_concurrent, 2);
    EXPECT_EQ(config.pool.max_queue, 0);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.server.port, 7001);
    EXPECT_EQ(config.log.level, "debug");
}

TEST_F(ConfigLoaderTest, IgnoresInvalidJsonValues) {
    Config config{};
    const auto data = nlohmann::json::parse(R"({
        "sandbox": {"timeoutMs": -5, "memoryMb": "lots", "interpreter": 42},
        "pool": {"maxConcurrent": 0},
        "server": {"port": 70000}
    })");
    ApplyConfigFromJson(config, data);

    EXPECT_EQ(config.sandbox.limits.timeout_ms, 10000);
    EXPECT_EQ(config.sandbox.limits.memory_mb, 64);
    EXPECT_EQ(config.sandbox.launch.interpreter, "node");
    EXPECT_EQ(config.pool.max_concurrent, 4);
    EXPECT_EQ(config.server.port, 6001);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesWithBothSpellings) {
    SetEnv("KATABOX_SANDBOX__TIMEOUT_MS", "1500");
    SetEnv("KATABOX_SANDBOX_MEMORY_MB", "32");
    SetEnv("KATABOX_SANDBOX__EXTRA_ARGS", "-s,--flag");
    SetEnv("KATABOX_POOL__MAX_QUEUE", "3");
    SetEnv("KATABOX_PORT", "7002");
    SetEnv("KATABOX_LOG_LEVEL", "WARN");

    Config config{};
    ApplyConfigFromEnv(config);

    EXPECT_EQ(config.sandbox.limits.timeout_ms, 1500);
    EXPECT_EQ(config.sandbox.limits.memory_mb, 32);
    EXPECT_EQ(config.sandbox.launch.extra_args, (std::vector<std::string>{"-s", "--flag"}));
    EXPECT_EQ(config.pool.max_queue, 3);
    EXPECT_EQ(config.server.port, 7002);
    EXPECT_EQ(config.log.level, "warn");
}

TEST_F(ConfigLoaderTest, DoubleUnderscoreWinsOverFallback) {
    SetEnv("KATABOX_SANDBOX__TIMEOUT_MS", "1000");
    SetEnv("KATABOX_SANDBOX_TIMEOUT_MS", "2000");
    Config config{};
    ApplyConfigFromEnv(config);
    EXPECT_EQ(config.sandbox.limits.timeout_ms, 1000);
}

TEST_F(ConfigLoaderTest, UnparsableEnvironmentKeepsPreviousValue) {
    SetEnv("KATABOX_SANDBOX__TIMEOUT_MS", "soon");
    SetEnv("KATABOX_SERVER__PORT", "0");
    Config config{};
    ApplyConfigFromEnv(config);
    EXPECT_EQ(config.sandbox.limits.timeout_ms, 10000);
    EXPECT_EQ(config.server.port, 6001);
}

TEST_F(ConfigLoaderTest, LoadsFileNamedByEnvironment) {
    SetEnv("KATABOX_CONFIG", WriteTempFile(R"({"sandbox": {"timeoutMs": 3000}})"));
    SetEnv("KATABOX_SANDBOX__MEMORY_MB", "96");

    const auto config = katabox::config::LoadConfig();
    EXPECT_EQ(config.sandbox.limits.timeout_ms, 3000);
    EXPECT_EQ(config.sandbox.limits.memory_mb, 96);
}

TEST_F(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    SetEnv("KATABOX_CONFIG", WriteTempFile("{ not json"));
    const auto config = katabox::config::LoadConfig();
    EXPECT_EQ(config.sandbox.limits.timeout_ms, 10000);
    EXPECT_EQ(config.server.port, 6001);
}
