#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/output_collector.hpp"
#include "sandbox/process_launcher.hpp"

namespace katabox::sandbox {

// Drives one child from launch to exactly one terminal state:
//
//   Starting -> Running -> Completed      (exit + both streams at EOF)
//                       -> TimedOut       (timer fired first)
//                       -> OutputLimited  (a stream passed its cap first)
//   Starting -> SpawnFailed
//
// Leaving Running is a single compare-exchange, so whichever of close,
// timeout or output cap gets there first decides the outcome. All handlers
// run on the owning io_context.
class LifecycleSupervisor : public std::enable_shared_from_this<LifecycleSupervisor> {
public:
    using CompletionHandler = std::function<void(ExecutionOutcome)>;

    LifecycleSupervisor(boost::asio::io_context& io,
                        const ProcessLauncher& launcher,
                        ExecutionRequest request,
                        katabox::config::ResourceLimits limits,
                        CompletionHandler on_complete);

    // Must be called from the io_context thread. The completion handler runs
    // exactly once, possibly before Start returns (spawn failure).
    void Start();

    SupervisorState State() const { return state_.load(); }
    int Pid() const;

private:
    bool TryLeaveRunning(SupervisorState terminal);
    void WriteSource();
    void StartReading(OutputStream stream);
    void OnRead(OutputStream stream, const boost::system::error_code& ec, std::size_t size);
    void OnExit(const std::error_code& ec);
    void OnTimeout(const boost::system::error_code& ec);
    void OnOutputLimit(OutputStream stream);
    void Terminate();
    void KillProcessGroup();
    void ClosePipes();
    void MaybeFinish();
    void Finish(TerminationFacts facts);

    boost::asio::io_context& io_;
    const ProcessLauncher& launcher_;
    ExecutionRequest request_;
    katabox::config::ResourceLimits limits_;
    CompletionHandler on_complete_;

    std::unique_ptr<ExecutionProcess> process_;
    OutputCollector collector_;
    CapturedOutput captured_;
    boost::asio::steady_timer timer_;

    std::atomic<SupervisorState> state_{SupervisorState::Starting};
    std::atomic<bool> finished_{false};
    std::chrono::steady_clock::time_point started_at_;
    std::chrono::steady_clock::time_point terminal_at_;

    bool exited_ = false;
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;
    std::optional<int> exit_code_;
    std::optional<int> term_signal_;

    std::array<char, 8192> stdout_chunk_{};
    std::array<char, 8192> stderr_chunk_{};
};

}  // namespace katabox::sandbox
