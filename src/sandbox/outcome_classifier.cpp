#include "sandbox/outcome_classifier.hpp"

#include <utility>

namespace katabox::sandbox {

double ToMilliseconds(std::chrono::steady_clock::duration elapsed) {
    return std::chrono::duration<double, std::milli>(elapsed).count();
}

ExecutionOutcome Classify(const TerminationFacts& facts,
                          CapturedOutput output,
                          const katabox::config::ResourceLimits& limits) {
    ExecutionOutcome outcome{};
    outcome.elapsed_ms = ToMilliseconds(facts.elapsed);

    if (facts.state == SupervisorState::SpawnFailed) {
        outcome.status = ExecutionStatus::SpawnError;
        outcome.success = false;
        outcome.error = "Process error: " + facts.spawn_error;
        return outcome;
    }

    outcome.exit_code = facts.exit_code;
    outcome.term_signal = facts.term_signal;
    outcome.stdout_data = std::move(output.stdout_data);
    outcome.stderr_data = std::move(output.stderr_data);
    outcome.stdout_truncated = output.stdout_truncated;
    outcome.stderr_truncated = output.stderr_truncated;

    switch (facts.state) {
        case SupervisorState::TimedOut:
            outcome.status = ExecutionStatus::Timeout;
            outcome.error = "Execution timed out (" + std::to_string(limits.timeout_ms) + "ms limit)";
            return outcome;
        case SupervisorState::OutputLimited:
            outcome.status = ExecutionStatus::OutputLimitExceeded;
            outcome.error = "Output limit exceeded (" + std::to_string(limits.max_output_bytes) + " bytes)";
            return outcome;
        default:
            break;
    }

    if (facts.exit_code.has_value() && *facts.exit_code == 0 && !facts.term_signal.has_value()) {
        outcome.status = ExecutionStatus::Success;
        outcome.success = true;
        return outcome;
    }
    outcome.status = ExecutionStatus::Failure;
    return outcome;
}

ExecutionOutcome MakeRejectedOutcome(const std::string& reason) {
    ExecutionOutcome outcome{};
    outcome.status = ExecutionStatus::Rejected;
    outcome.success = false;
    outcome.error = reason;
    return outcome;
}

}  // namespace katabox::sandbox
