#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace katabox::sandbox {

struct ExecutionRequest {
    std::string source;
    std::chrono::system_clock::time_point submitted_at = std::chrono::system_clock::now();
};

enum class ExecutionStatus {
    Success,
    Failure,
    Timeout,
    OutputLimitExceeded,
    SpawnError,
    Rejected
};

inline const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Success: return "success";
        case ExecutionStatus::Failure: return "failure";
        case ExecutionStatus::Timeout: return "timeout";
        case ExecutionStatus::OutputLimitExceeded: return "output_limit_exceeded";
        case ExecutionStatus::SpawnError: return "spawn_error";
        case ExecutionStatus::Rejected: return "rejected";
    }
    return "unknown";
}

struct CapturedOutput {
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
};

struct ExecutionOutcome {
    ExecutionStatus status = ExecutionStatus::Failure;
    bool success = false;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    double elapsed_ms = 0.0;
    std::string stdout_data;
    std::string stderr_data;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::optional<std::string> error;
};

// Supervisor states. Completed, TimedOut, OutputLimited and SpawnFailed are
// terminal.
enum class SupervisorState {
    Starting,
    Running,
    Completed,
    TimedOut,
    OutputLimited,
    SpawnFailed
};

inline const char* ToString(SupervisorState state) {
    switch (state) {
        case SupervisorState::Starting: return "starting";
        case SupervisorState::Running: return "running";
        case SupervisorState::Completed: return "completed";
        case SupervisorState::TimedOut: return "timed_out";
        case SupervisorState::OutputLimited: return "output_limited";
        case SupervisorState::SpawnFailed: return "spawn_failed";
    }
    return "unknown";
}

inline bool IsTerminal(SupervisorState state) {
    return state != SupervisorState::Starting && state != SupervisorState::Running;
}

struct TerminationFacts {
    SupervisorState state = SupervisorState::Completed;
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::chrono::steady_clock::duration elapsed{};
    std::string spawn_error;
};

}  // namespace katabox::sandbox
