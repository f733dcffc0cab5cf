#include "sandbox/lifecycle_supervisor.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/write.hpp>
#include <sys/wait.h>

#include "sandbox/outcome_classifier.hpp"
#include "utils/logging.hpp"

namespace katabox::sandbox {
namespace {

std::size_t CapacityFor(const katabox::config::ResourceLimits& limits) {
    return limits.max_output_bytes > 0 ? static_cast<std::size_t>(limits.max_output_bytes) : 0;
}

void ClosePipe(boost::process::async_pipe& pipe, const char* name) {
    if (!pipe.is_open()) {
        return;
    }
    boost::system::error_code ec;
    pipe.close(ec);
    if (ec) {
        utils::Log(utils::LogLevel::kDebug, "sandbox",
                   std::string("close ") + name + " failed: " + ec.message());
    }
}

}  // namespace

LifecycleSupervisor::LifecycleSupervisor(boost::asio::io_context& io,
                                         const ProcessLauncher& launcher,
                                         ExecutionRequest request,
                                         katabox::config::ResourceLimits limits,
                                         CompletionHandler on_complete)
    : io_(io)
    , launcher_(launcher)
    , request_(std::move(request))
    , limits_(limits)
    , on_complete_(std::move(on_complete))
    , collector_(CapacityFor(limits))
    , timer_(io) {}

int LifecycleSupervisor::Pid() const {
    return process_ ? process_->pid : -1;
}

void LifecycleSupervisor::Start() {
    started_at_ = std::chrono::steady_clock::now();
    auto self = shared_from_this();
    try {
        process_ = launcher_.Launch(limits_, [self](const std::error_code& ec) {
            self->OnExit(ec);
        });
    } catch (const LaunchError& ex) {
        state_.store(SupervisorState::SpawnFailed);
        terminal_at_ = std::chrono::steady_clock::now();
        utils::Log(utils::LogLevel::kWarn, "sandbox", std::string("spawn failed: ") + ex.what());
        TerminationFacts facts{};
        facts.state = SupervisorState::SpawnFailed;
        facts.elapsed = terminal_at_ - started_at_;
        facts.spawn_error = ex.what();
        Finish(std::move(facts));
        return;
    }
    state_.store(SupervisorState::Running);

    try {
        timer_.expires_after(std::chrono::milliseconds(limits_.timeout_ms));
        timer_.async_wait([self](const boost::system::error_code& ec) {
            self->OnTimeout(ec);
        });
        StartReading(OutputStream::Stdout);
        StartReading(OutputStream::Stderr);
        WriteSource();
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "sandbox",
                   "failed to supervise pid " + std::to_string(Pid()) + ": " + ex.what());
        state_.store(SupervisorState::SpawnFailed);
        terminal_at_ = std::chrono::steady_clock::now();
        KillProcessGroup();
        timer_.cancel();
        TerminationFacts facts{};
        facts.state = SupervisorState::SpawnFailed;
        facts.elapsed = terminal_at_ - started_at_;
        facts.spawn_error = ex.what();
        Finish(std::move(facts));
    }
}

bool LifecycleSupervisor::TryLeaveRunning(SupervisorState terminal) {
    auto expected = SupervisorState::Running;
    if (!state_.compare_exchange_strong(expected, terminal)) {
        return false;
    }
    terminal_at_ = std::chrono::steady_clock::now();
    return true;
}

void LifecycleSupervisor::WriteSource() {
    if (request_.source.empty()) {
        ClosePipe(process_->stdin_pipe, "stdin");
        return;
    }
    auto self = shared_from_this();
    boost::asio::async_write(
        process_->stdin_pipe,
        boost::asio::buffer(request_.source),
        [self](const boost::system::error_code& ec, std::size_t) {
            if (ec && ec != boost::asio::error::operation_aborted) {
                // The child may exit without draining stdin; EPIPE lands here.
                utils::Log(utils::LogLevel::kDebug, "sandbox", "stdin write failed: " + ec.message());
            }
            ClosePipe(self->process_->stdin_pipe, "stdin");
        });
}

void LifecycleSupervisor::StartReading(OutputStream stream) {
    auto self = shared_from_this();
    auto handler = [self, stream](const boost::system::error_code& ec, std::size_t size) {
        self->OnRead(stream, ec, size);
    };
    if (stream == OutputStream::Stdout) {
        process_->stdout_pipe.async_read_some(boost::asio::buffer(stdout_chunk_), handler);
    } else {
        process_->stderr_pipe.async_read_some(boost::asio::buffer(stderr_chunk_), handler);
    }
}

void LifecycleSupervisor::OnRead(OutputStream stream,
                                 const boost::system::error_code& ec,
                                 std::size_t size) {
    if (size > 0 && state_.load() == SupervisorState::Running) {
        const auto& chunk = stream == OutputStream::Stdout ? stdout_chunk_ : stderr_chunk_;
        if (collector_.Append(stream, chunk.data(), size)) {
            OnOutputLimit(stream);
        }
    }

    if (ec || state_.load() != SupervisorState::Running) {
        if (ec && ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
            utils::Log(utils::LogLevel::kDebug, "sandbox",
                       std::string(ToString(stream)) + " read failed: " + ec.message());
        }
        (stream == OutputStream::Stdout ? stdout_eof_ : stderr_eof_) = true;
        MaybeFinish();
        return;
    }
    StartReading(stream);
}

void LifecycleSupervisor::OnExit(const std::error_code& ec) {
    exited_ = true;
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "wait for pid " + std::to_string(Pid()) + " failed: " + ec.message());
    } else {
        const int status = process_->child.native_exit_code();
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            term_signal_ = WTERMSIG(status);
        }
    }
    MaybeFinish();
}

void LifecycleSupervisor::OnTimeout(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
        return;
    }
    if (!TryLeaveRunning(SupervisorState::TimedOut)) {
        return;
    }
    utils::Log(utils::LogMessage{
        utils::LogLevel::kInfo,
        "sandbox",
        "timeout",
        {{"pid", std::to_string(Pid())}, {"limit_ms", std::to_string(limits_.timeout_ms)}}});
    Terminate();
    MaybeFinish();
}

void LifecycleSupervisor::OnOutputLimit(OutputStream stream) {
    if (!TryLeaveRunning(SupervisorState::OutputLimited)) {
        return;
    }
    utils::Log(utils::LogMessage{
        utils::LogLevel::kInfo,
        "sandbox",
        "output limit reached",
        {{"pid", std::to_string(Pid())},
         {"stream", ToString(stream)},
         {"limit_bytes", std::to_string(limits_.max_output_bytes)}}});
    Terminate();
    MaybeFinish();
}

void LifecycleSupervisor::Terminate() {
    KillProcessGroup();
    captured_ = collector_.Seal();
    timer_.cancel();
    ClosePipes();
}

void LifecycleSupervisor::KillProcessGroup() {
    const int pid = Pid();
    if (pid <= 0) {
        return;
    }
    // The child leads its own group; a group kill also reaches anything it
    // forked. Once the leader is reaped its id stays reserved only while a
    // group member is alive, which an open pipe end indicates; with both
    // pipes at EOF the id may already belong to someone else.
    if (exited_ && stdout_eof_ && stderr_eof_) {
        return;
    }
    if (::kill(-pid, SIGKILL) != 0 && errno != ESRCH) {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "kill group " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }
    if (exited_) {
        return;
    }
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "kill " + std::to_string(pid) + " failed: " + std::strerror(errno));
    }
}

void LifecycleSupervisor::ClosePipes() {
    if (!process_) {
        return;
    }
    ClosePipe(process_->stdin_pipe, "stdin");
    ClosePipe(process_->stdout_pipe, "stdout");
    ClosePipe(process_->stderr_pipe, "stderr");
}

void LifecycleSupervisor::MaybeFinish() {
    if (finished_.load()) {
        return;
    }
    const auto state = state_.load();
    if (state == SupervisorState::Running) {
        if (!exited_ || !stdout_eof_ || !stderr_eof_) {
            return;
        }
        if (!TryLeaveRunning(SupervisorState::Completed)) {
            MaybeFinish();
            return;
        }
        captured_ = collector_.Seal();
        timer_.cancel();
    } else if (!IsTerminal(state) || !exited_) {
        return;
    }

    TerminationFacts facts{};
    facts.state = state_.load();
    facts.exit_code = exit_code_;
    facts.term_signal = term_signal_;
    facts.elapsed = terminal_at_ - started_at_;
    Finish(std::move(facts));
}

void LifecycleSupervisor::Finish(TerminationFacts facts) {
    if (finished_.exchange(true)) {
        return;
    }
    ClosePipes();

    auto outcome = Classify(facts, std::move(captured_), limits_);
    utils::Log(utils::LogMessage{
        utils::LogLevel::kDebug,
        "sandbox",
        "finished",
        {{"pid", std::to_string(Pid())},
         {"state", ToString(facts.state)},
         {"status", ToString(outcome.status)},
         {"exit_code", facts.exit_code ? std::to_string(*facts.exit_code) : "-"},
         {"signal", facts.term_signal ? std::to_string(*facts.term_signal) : "-"},
         {"elapsed_ms", std::to_string(outcome.elapsed_ms)}}});

    auto handler = std::move(on_complete_);
    on_complete_ = nullptr;
    if (handler) {
        handler(std::move(outcome));
    }
}

}  // namespace katabox::sandbox
