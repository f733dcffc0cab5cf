#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include "config/config_schema.hpp"

namespace katabox::sandbox {

class LaunchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A live child. Owned by exactly one supervisor from spawn until the child
// has been reaped.
struct ExecutionProcess {
    explicit ExecutionProcess(boost::asio::io_context& io)
        : stdin_pipe(io)
        , stdout_pipe(io)
        , stderr_pipe(io) {}

    boost::process::child child;
    int pid = -1;
    std::chrono::steady_clock::time_point started_at;
    katabox::config::ResourceLimits limits;
    boost::process::async_pipe stdin_pipe;
    boost::process::async_pipe stdout_pipe;
    boost::process::async_pipe stderr_pipe;
};

class ProcessLauncher {
public:
    // Runs on the io_context once the child has exited; the raw wait status
    // is available from ExecutionProcess::child.native_exit_code().
    using ExitHandler = std::function<void(const std::error_code&)>;

    ProcessLauncher(boost::asio::io_context& io, katabox::config::LaunchOptions options);

    // Throws LaunchError when the interpreter cannot be started.
    std::unique_ptr<ExecutionProcess> Launch(const katabox::config::ResourceLimits& limits,
                                             ExitHandler on_exit) const;

    std::vector<std::string> BuildArgs(const katabox::config::ResourceLimits& limits) const;
    boost::process::environment BuildEnvironment() const;
    boost::filesystem::path ResolveInterpreter() const;

    const katabox::config::LaunchOptions& Options() const { return options_; }

private:
    boost::asio::io_context& io_;
    katabox::config::LaunchOptions options_;
};

}  // namespace katabox::sandbox
