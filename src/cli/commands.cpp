#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

#include "api/playground_api.hpp"
#include "config/config_loader.hpp"
#include "httplib.h"
#include "sandbox/execution_dispatcher.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void SendJson(httplib::Response& res, const katabox::api::ApiResponse& response) {
    res.status = response.status;
    res.set_content(katabox::api::Serialize(response.body), "application/json");
}

std::optional<int> ParsePort(const std::string& value) {
    try {
        const int port = std::stoi(value);
        if (port > 0 && port < 65536) {
            return port;
        }
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    return std::nullopt;
}

int ResolvePort(int argc, char** argv, const katabox::config::Config& config) {
    if (argc >= 3) {
        if (const auto port = ParsePort(argv[2])) {
            return *port;
        }
        std::cerr << "[http] ignoring invalid port argument: " << argv[2] << std::endl;
    }
    if (const char* value = std::getenv("PORT")) {
        if (const auto port = ParsePort(value)) {
            return *port;
        }
    }
    return config.server.port;
}

void InstallRoutes(httplib::Server& server, katabox::sandbox::ExecutionDispatcher& dispatcher) {
    server.set_default_headers({
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type"}
    });

    server.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    server.Get("/api/health", [&dispatcher](const httplib::Request&, httplib::Response& res) {
        SendJson(res, {200, katabox::api::HealthJson(dispatcher.GetStats())});
    });

    server.Post("/api/playground/run", [&dispatcher](const httplib::Request& req, httplib::Response& res) {
        SendJson(res, katabox::api::HandleRun(dispatcher, req.body));
    });

    server.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.status == 404 && req.path.rfind("/api/", 0) == 0) {
            SendJson(res, katabox::api::NotFound());
        }
    });
}

int RunServer(int argc, char** argv) {
    auto config = katabox::config::LoadConfig();
    katabox::utils::LogConfig log_config{};
    log_config.min_level = katabox::utils::LogLevelFromString(config.log.level, log_config.min_level);
    katabox::utils::ApplyLogConfig(log_config);

    const int port = ResolvePort(argc, argv, config);
    katabox::sandbox::ExecutionDispatcher dispatcher(config.sandbox, config.pool);

    httplib::Server http_server;
    InstallRoutes(http_server, dispatcher);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.server.host;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host.c_str(), port)) {
            std::cerr << "[http] server failed to listen on " << host << ":" << port << std::endl;
            listen_failed.store(true);
        }
    });

    std::cout << "katabox listening on http://" << host << ":" << port
              << " (timeout=" << config.sandbox.limits.timeout_ms << "ms"
              << ", memory=" << config.sandbox.limits.memory_mb << "MB"
              << ", workers=" << config.pool.max_concurrent << ")" << std::endl;

    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    dispatcher.Stop();
    std::cout << "katabox stopped." << std::endl;
    return listen_failed.load() ? 1 : 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "serve") {
        return RunServer(argc, argv);
    }
    std::cout << "Usage: katabox serve [port]" << std::endl;
    return 1;
}
