#include "sandbox/process_launcher.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/process/extend.hpp>
#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <unistd.h>

#include "utils/logging.hpp"

namespace katabox::sandbox {
namespace bp = boost::process;

namespace {

std::vector<boost::filesystem::path> SplitSearchPath(const std::string& value) {
    std::vector<boost::filesystem::path> dirs;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ':')) {
        if (!item.empty()) {
            dirs.emplace_back(item);
        }
    }
    return dirs;
}

// Pipes are created without O_CLOEXEC; without this every later child would
// inherit the host ends of its neighbours' pipes and hold them open.
void MarkCloseOnExec(int fd) {
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags == -1 || ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC) == -1) {
        throw LaunchError(std::string("fcntl(FD_CLOEXEC) failed: ") + std::strerror(errno));
    }
}

void MarkCloseOnExec(const bp::async_pipe& pipe) {
    MarkCloseOnExec(pipe.native_source());
    MarkCloseOnExec(pipe.native_sink());
}

// Runs in the forked child before exec; only async-signal-safe calls.
void ApplyChildLimits(int address_space_mb, int max_open_files) {
    ::setpgid(0, 0);
    ::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);

    rlimit core{0, 0};
    ::setrlimit(RLIMIT_CORE, &core);

    if (max_open_files > 0) {
        rlimit files{};
        files.rlim_cur = static_cast<rlim_t>(max_open_files);
        files.rlim_max = static_cast<rlim_t>(max_open_files);
        ::setrlimit(RLIMIT_NOFILE, &files);
    }
    if (address_space_mb > 0) {
        rlimit as{};
        as.rlim_cur = static_cast<rlim_t>(address_space_mb) * 1024 * 1024;
        as.rlim_max = as.rlim_cur;
        ::setrlimit(RLIMIT_AS, &as);
    }
}

}  // namespace

ProcessLauncher::ProcessLauncher(boost::asio::io_context& io, katabox::config::LaunchOptions options)
    : io_(io)
    , options_(std::move(options)) {}

std::vector<std::string> ProcessLauncher::BuildArgs(const katabox::config::ResourceLimits& limits) const {
    std::vector<std::string> args;
    if (!options_.memory_flag_prefix.empty() && limits.memory_mb > 0) {
        args.push_back(options_.memory_flag_prefix + std::to_string(limits.memory_mb));
    }
    args.insert(args.end(), options_.extra_args.begin(), options_.extra_args.end());
    return args;
}

bp::environment ProcessLauncher::BuildEnvironment() const {
    bp::environment env;
    env["NODE_PATH"] = std::string();
    env["PATH"] = options_.search_path;
    env["HOME"] = options_.home_dir;
    return env;
}

boost::filesystem::path ProcessLauncher::ResolveInterpreter() const {
    const boost::filesystem::path interpreter(options_.interpreter);
    if (interpreter.empty() || interpreter.has_parent_path()) {
        return interpreter;
    }
    return bp::search_path(interpreter, SplitSearchPath(options_.search_path));
}

std::unique_ptr<ExecutionProcess> ProcessLauncher::Launch(const katabox::config::ResourceLimits& limits,
                                                          ExitHandler on_exit) const {
    const auto interpreter = ResolveInterpreter();
    if (interpreter.empty()) {
        throw LaunchError("interpreter not found: " + options_.interpreter);
    }

    const auto args = BuildArgs(limits);
    auto env = BuildEnvironment();
    const int address_space_mb = limits.address_space_mb;
    const int max_open_files = limits.max_open_files;

    std::unique_ptr<ExecutionProcess> process;
    try {
        process = std::make_unique<ExecutionProcess>(io_);
        process->limits = limits;
        MarkCloseOnExec(process->stdin_pipe);
        MarkCloseOnExec(process->stdout_pipe);
        MarkCloseOnExec(process->stderr_pipe);
        auto& io = io_;
        process->child = bp::child(
            bp::exe = interpreter,
            bp::args = args,
            env,
            bp::start_dir = options_.working_dir,
            bp::std_in < process->stdin_pipe,
            bp::std_out > process->stdout_pipe,
            bp::std_err > process->stderr_pipe,
            io_,
            // The exit callback fires from inside Boost's SIGCHLD dispatch,
            // which must not be re-entered by spawning another child.
            bp::on_exit([&io, on_exit](int, const std::error_code& ec) {
                boost::asio::post(io, [on_exit, ec]() { on_exit(ec); });
            }),
            bp::extend::on_exec_setup = [address_space_mb, max_open_files](auto&) {
                ApplyChildLimits(address_space_mb, max_open_files);
            });
    } catch (const bp::process_error& ex) {
        if (process) {
            // Never launched; keep the destructor from waiting on it.
            process->child.detach();
        }
        throw LaunchError(ex.what());
    } catch (const LaunchError&) {
        process->child.detach();
        throw;
    }

    process->pid = process->child.id();
    process->started_at = std::chrono::steady_clock::now();
    utils::Log(utils::LogMessage{
        utils::LogLevel::kDebug,
        "sandbox",
        "spawned",
        {{"pid", std::to_string(process->pid)}, {"interpreter", interpreter.string()}}});
    return process;
}

}  // namespace katabox::sandbox
