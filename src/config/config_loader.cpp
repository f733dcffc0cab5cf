#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "utils/logging.hpp"

namespace katabox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void ApplyPositiveInt(int& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_number_integer()) {
        const auto value = source[key].get<long long>();
        if (value > 0 && value <= 0x7fffffff) {
            target = static_cast<int>(value);
        }
    }
}

void ApplyString(std::string& target, const nlohmann::json& source, const char* key) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplySandboxFromJson(SandboxConfig& sandbox, const nlohmann::json& data) {
    auto& limits = sandbox.limits;
    ApplyPositiveInt(limits.timeout_ms, data, "timeoutMs");
    ApplyPositiveInt(limits.memory_mb, data, "memoryMb");
    ApplyPositiveInt(limits.max_open_files, data, "maxOpenFiles");
    if (data.contains("maxOutputBytes") && data["maxOutputBytes"].is_number_integer()) {
        const auto value = data["maxOutputBytes"].get<long long>();
        if (value >= 0) {
            limits.max_output_bytes = value;
        }
    }
    if (data.contains("addressSpaceMb") && data["addressSpaceMb"].is_number_integer()) {
        const auto value = data["addressSpaceMb"].get<int>();
        if (value >= 0) {
            limits.address_space_mb = value;
        }
    }

    auto& launch = sandbox.launch;
    ApplyString(launch.interpreter, data, "interpreter");
    ApplyString(launch.memory_flag_prefix, data, "memoryFlagPrefix");
    ApplyString(launch.search_path, data, "searchPath");
    ApplyString(launch.home_dir, data, "homeDir");
    ApplyString(launch.working_dir, data, "workingDir");
    if (data.contains("extraArgs") && data["extraArgs"].is_array()) {
        launch.extra_args.clear();
        for (const auto& item : data["extraArgs"]) {
            if (item.is_string()) {
                launch.extra_args.push_back(item.get<std::string>());
            }
        }
    }
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return fallback;
    }
}

int ParsePositiveInt(const std::string& value, int fallback) {
    const auto parsed = ParseInt(value, fallback);
    return parsed > 0 ? parsed : fallback;
}

std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("KATABOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".katabox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplySandboxFromJson(config.sandbox, data["sandbox"]);
    }

    if (data.contains("pool") && data["pool"].is_object()) {
        const auto& pool = data["pool"];
        ApplyPositiveInt(config.pool.max_concurrent, pool, "maxConcurrent");
        if (pool.contains("maxQueue") && pool["maxQueue"].is_number_integer()) {
            const auto value = pool["maxQueue"].get<int>();
            if (value >= 0) {
                config.pool.max_queue = value;
            }
        }
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(config.server.host, server, "host");
        if (server.contains("port") && server["port"].is_number_integer()) {
            const auto value = server["port"].get<int>();
            if (value > 0 && value < 65536) {
                config.server.port = value;
            }
        }
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            config.log.level = ToLower(log["level"].get<std::string>());
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    auto& limits = config.sandbox.limits;
    auto& launch = config.sandbox.launch;

    const auto timeout_ms = GetEnvFallback(
        "KATABOX_SANDBOX__TIMEOUT_MS",
        "KATABOX_SANDBOX_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        limits.timeout_ms = ParsePositiveInt(timeout_ms, limits.timeout_ms);
    }

    const auto memory_mb = GetEnvFallback(
        "KATABOX_SANDBOX__MEMORY_MB",
        "KATABOX_SANDBOX_MEMORY_MB");
    if (!memory_mb.empty()) {
        limits.memory_mb = ParsePositiveInt(memory_mb, limits.memory_mb);
    }

    const auto max_output = GetEnvFallback(
        "KATABOX_SANDBOX__MAX_OUTPUT_BYTES",
        "KATABOX_SANDBOX_MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        const auto value = ParseInt(max_output, -1);
        if (value >= 0) {
            limits.max_output_bytes = value;
        }
    }

    const auto address_space = GetEnvFallback(
        "KATABOX_SANDBOX__ADDRESS_SPACE_MB",
        "KATABOX_SANDBOX_ADDRESS_SPACE_MB");
    if (!address_space.empty()) {
        const auto value = ParseInt(address_space, -1);
        if (value >= 0) {
            limits.address_space_mb = value;
        }
    }

    const auto interpreter = GetEnvFallback(
        "KATABOX_SANDBOX__INTERPRETER",
        "KATABOX_SANDBOX_INTERPRETER");
    if (!interpreter.empty()) {
        launch.interpreter = interpreter;
    }

    const auto extra_args = GetEnvFallback(
        "KATABOX_SANDBOX__EXTRA_ARGS",
        "KATABOX_SANDBOX_EXTRA_ARGS");
    if (!extra_args.empty()) {
        launch.extra_args = SplitCsv(extra_args);
    }

    const auto search_path = GetEnvFallback(
        "KATABOX_SANDBOX__SEARCH_PATH",
        "KATABOX_SANDBOX_SEARCH_PATH");
    if (!search_path.empty()) {
        launch.search_path = search_path;
    }

    const auto home_dir = GetEnvFallback(
        "KATABOX_SANDBOX__HOME_DIR",
        "KATABOX_SANDBOX_HOME_DIR");
    if (!home_dir.empty()) {
        launch.home_dir = home_dir;
    }

    const auto max_concurrent = GetEnvFallback(
        "KATABOX_POOL__MAX_CONCURRENT",
        "KATABOX_POOL_MAX_CONCURRENT");
    if (!max_concurrent.empty()) {
        config.pool.max_concurrent = ParsePositiveInt(max_concurrent, config.pool.max_concurrent);
    }

    const auto max_queue = GetEnvFallback(
        "KATABOX_POOL__MAX_QUEUE",
        "KATABOX_POOL_MAX_QUEUE");
    if (!max_queue.empty()) {
        const auto value = ParseInt(max_queue, -1);
        if (value >= 0) {
            config.pool.max_queue = value;
        }
    }

    const auto host = GetEnvFallback("KATABOX_SERVER__HOST", "KATABOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("KATABOX_SERVER__PORT", "KATABOX_PORT");
    if (!port.empty()) {
        const auto value = ParseInt(port, config.server.port);
        if (value > 0 && value < 65536) {
            config.server.port = value;
        }
    }

    const auto log_level = GetEnvFallback("KATABOX_LOG__LEVEL", "KATABOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = ToLower(log_level);
    }
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        try {
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config",
                       "failed to parse " + config_path.string() + ": " + ex.what() +
                       "; keeping defaults");
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

}  // namespace katabox::config
