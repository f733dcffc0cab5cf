#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"
#include "sandbox/process_launcher.hpp"

namespace katabox::sandbox {

// Entry point for running submissions. Owns the event loop every execution
// is supervised on and caps how many children run at once; requests beyond
// the cap wait in a bounded queue and are rejected once it is full.
class ExecutionDispatcher {
public:
    using CompletionHandler = std::function<void(ExecutionOutcome)>;

    struct Stats {
        std::size_t active = 0;
        std::size_t queued = 0;
        std::uint64_t completed = 0;
        std::uint64_t rejected = 0;
    };

    ExecutionDispatcher(katabox::config::SandboxConfig sandbox,
                        katabox::config::PoolConfig pool);
    ~ExecutionDispatcher();

    ExecutionDispatcher(const ExecutionDispatcher&) = delete;
    ExecutionDispatcher& operator=(const ExecutionDispatcher&) = delete;

    // Thread-safe. The handler runs exactly once, on the dispatcher thread
    // (or on the caller's thread when the dispatcher is already stopped).
    void Submit(ExecutionRequest request, CompletionHandler on_complete);
    void Submit(ExecutionRequest request,
                const katabox::config::ResourceLimits& limits,
                CompletionHandler on_complete);

    std::future<ExecutionOutcome> Execute(std::string source);
    std::future<ExecutionOutcome> Execute(std::string source,
                                          const katabox::config::ResourceLimits& limits);

    // Rejects queued requests, lets running ones finish, then joins the loop.
    // May be called from a completion handler, in which case it returns
    // without joining. The dispatcher itself must not be destroyed from one.
    void Stop();

    Stats GetStats() const;
    const katabox::config::ResourceLimits& DefaultLimits() const { return default_limits_; }

private:
    struct PendingExecution {
        ExecutionRequest request;
        katabox::config::ResourceLimits limits;
        CompletionHandler on_complete;
    };

    void RunLoop();
    void Admit(PendingExecution pending);
    void Launch(PendingExecution pending);
    void OnFinished();
    void Reject(PendingExecution& pending, const std::string& reason);
    static void Deliver(CompletionHandler& handler, ExecutionOutcome outcome);

    boost::asio::io_context io_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    ProcessLauncher launcher_;
    katabox::config::ResourceLimits default_limits_;
    std::size_t max_concurrent_;
    std::size_t max_queue_;

    // Touched only on the loop thread.
    std::deque<PendingExecution> queue_;
    std::size_t active_ = 0;

    std::mutex submit_mutex_;
    std::mutex join_mutex_;
    std::atomic<bool> stopping_{false};
    std::atomic<std::size_t> active_count_{0};
    std::atomic<std::size_t> queued_count_{0};
    std::atomic<std::uint64_t> completed_{0};
    std::atomic<std::uint64_t> rejected_{0};
    std::thread worker_;
    std::thread::id worker_id_;
};

}  // namespace katabox::sandbox
