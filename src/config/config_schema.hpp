#pragma once

#include <string>
#include <vector>

namespace katabox::config {

struct ResourceLimits {
    int timeout_ms = 10000;
    int memory_mb = 64;
    long long max_output_bytes = 1024 * 1024;
    int address_space_mb = 0;
    int max_open_files = 64;
};

struct LaunchOptions {
    std::string interpreter = "node";
    std::string memory_flag_prefix = "--max-old-space-size=";
    std::vector<std::string> extra_args = {"--input-type=module", "-"};
    std::string search_path = "/usr/local/bin:/usr/bin:/bin";
    std::string home_dir = "/tmp";
    std::string working_dir = "/tmp";
};

struct SandboxConfig {
    ResourceLimits limits;
    LaunchOptions launch;
};

struct PoolConfig {
    int max_concurrent = 4;
    int max_queue = 64;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 6001;
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    PoolConfig pool;
    ServerConfig server;
    LogSettings log;
};

}  // namespace katabox::config
