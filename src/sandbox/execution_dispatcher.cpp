#include "sandbox/execution_dispatcher.hpp"

#include <csignal>
#include <memory>
#include <utility>

#include <boost/asio/post.hpp>

#include "sandbox/lifecycle_supervisor.hpp"
#include "sandbox/outcome_classifier.hpp"
#include "utils/logging.hpp"

namespace katabox::sandbox {
namespace {

constexpr const char* kQueueFull = "Execution queue is full";
constexpr const char* kShuttingDown = "Dispatcher is shutting down";

}  // namespace

ExecutionDispatcher::ExecutionDispatcher(katabox::config::SandboxConfig sandbox,
                                         katabox::config::PoolConfig pool)
    : work_(boost::asio::make_work_guard(io_))
    , launcher_(io_, std::move(sandbox.launch))
    , default_limits_(sandbox.limits)
    , max_concurrent_(pool.max_concurrent > 0 ? static_cast<std::size_t>(pool.max_concurrent) : 1)
    , max_queue_(pool.max_queue > 0 ? static_cast<std::size_t>(pool.max_queue) : 0) {
    // A child that exits without reading stdin must surface as EPIPE on the
    // write, not kill the host.
    std::signal(SIGPIPE, SIG_IGN);
    worker_ = std::thread([this]() { RunLoop(); });
    worker_id_ = worker_.get_id();
}

ExecutionDispatcher::~ExecutionDispatcher() {
    Stop();
}

void ExecutionDispatcher::RunLoop() {
    for (;;) {
        try {
            io_.run();
            return;
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kError, "dispatcher",
                       std::string("handler raised: ") + ex.what());
        }
    }
}

void ExecutionDispatcher::Submit(ExecutionRequest request, CompletionHandler on_complete) {
    Submit(std::move(request), default_limits_, std::move(on_complete));
}

void ExecutionDispatcher::Submit(ExecutionRequest request,
                                 const katabox::config::ResourceLimits& limits,
                                 CompletionHandler on_complete) {
    PendingExecution pending{std::move(request), limits, std::move(on_complete)};
    {
        std::lock_guard<std::mutex> lock(submit_mutex_);
        if (!stopping_.load()) {
            boost::asio::post(io_, [this, pending = std::move(pending)]() mutable {
                Admit(std::move(pending));
            });
            return;
        }
    }
    Reject(pending, kShuttingDown);
}

std::future<ExecutionOutcome> ExecutionDispatcher::Execute(std::string source) {
    return Execute(std::move(source), default_limits_);
}

std::future<ExecutionOutcome> ExecutionDispatcher::Execute(std::string source,
                                                           const katabox::config::ResourceLimits& limits) {
    auto promise = std::make_shared<std::promise<ExecutionOutcome>>();
    auto future = promise->get_future();
    ExecutionRequest request{};
    request.source = std::move(source);
    Submit(std::move(request), limits, [promise](ExecutionOutcome outcome) {
        promise->set_value(std::move(outcome));
    });
    return future;
}

void ExecutionDispatcher::Admit(PendingExecution pending) {
    if (stopping_.load()) {
        Reject(pending, kShuttingDown);
        return;
    }
    if (active_ < max_concurrent_) {
        Launch(std::move(pending));
        return;
    }
    if (queue_.size() < max_queue_) {
        queue_.push_back(std::move(pending));
        queued_count_.store(queue_.size());
        return;
    }
    utils::Log(utils::LogMessage{
        utils::LogLevel::kWarn,
        "dispatcher",
        "rejecting request",
        {{"active", std::to_string(active_)}, {"queued", std::to_string(queue_.size())}}});
    Reject(pending, kQueueFull);
}

void ExecutionDispatcher::Launch(PendingExecution pending) {
    ++active_;
    active_count_.store(active_);
    auto handler = std::make_shared<CompletionHandler>(std::move(pending.on_complete));
    try {
        auto supervisor = std::make_shared<LifecycleSupervisor>(
            io_,
            launcher_,
            std::move(pending.request),
            pending.limits,
            [this, handler](ExecutionOutcome outcome) {
                Deliver(*handler, std::move(outcome));
                OnFinished();
            });
        supervisor->Start();
    } catch (const std::exception& ex) {
        // Supervisor construction failed before it could own the request.
        utils::Log(utils::LogLevel::kError, "dispatcher",
                   std::string("failed to start execution: ") + ex.what());
        TerminationFacts facts{};
        facts.state = SupervisorState::SpawnFailed;
        facts.spawn_error = ex.what();
        Deliver(*handler, Classify(facts, CapturedOutput{}, pending.limits));
        OnFinished();
    }
}

void ExecutionDispatcher::OnFinished() {
    --active_;
    active_count_.store(active_);
    completed_.fetch_add(1);
    while (active_ < max_concurrent_ && !queue_.empty()) {
        auto next = std::move(queue_.front());
        queue_.pop_front();
        queued_count_.store(queue_.size());
        if (stopping_.load()) {
            Reject(next, kShuttingDown);
            continue;
        }
        Launch(std::move(next));
    }
}

void ExecutionDispatcher::Reject(PendingExecution& pending, const std::string& reason) {
    rejected_.fetch_add(1);
    Deliver(pending.on_complete, MakeRejectedOutcome(reason));
}

void ExecutionDispatcher::Deliver(CompletionHandler& handler, ExecutionOutcome outcome) {
    if (!handler) {
        return;
    }
    try {
        handler(std::move(outcome));
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "dispatcher",
                   std::string("completion handler raised: ") + ex.what());
    }
}

void ExecutionDispatcher::Stop() {
    {
        std::lock_guard<std::mutex> lock(submit_mutex_);
        if (!stopping_.exchange(true)) {
            boost::asio::post(io_, [this]() {
                while (!queue_.empty()) {
                    auto next = std::move(queue_.front());
                    queue_.pop_front();
                    Reject(next, kShuttingDown);
                }
                queued_count_.store(0);
            });
            work_.reset();
        }
    }
    // From a completion handler the loop cannot wait for itself; the join is
    // left to a later Stop or the destructor.
    if (std::this_thread::get_id() == worker_id_) {
        return;
    }
    std::lock_guard<std::mutex> lock(join_mutex_);
    if (worker_.joinable()) {
        worker_.join();
    }
}

ExecutionDispatcher::Stats ExecutionDispatcher::GetStats() const {
    Stats stats{};
    stats.active = active_count_.load();
    stats.queued = queued_count_.load();
    stats.completed = completed_.load();
    stats.rejected = rejected_.load();
    return stats;
}

}  // namespace katabox::sandbox
