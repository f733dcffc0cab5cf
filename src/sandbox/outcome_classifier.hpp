#pragma once

#include "config/config_schema.hpp"
#include "sandbox/execution_types.hpp"

namespace katabox::sandbox {

// Maps termination facts to the single outcome reported for a request.
// Precedence: spawn failure, timeout, output cap, then exit status.
ExecutionOutcome Classify(const TerminationFacts& facts,
                          CapturedOutput output,
                          const katabox::config::ResourceLimits& limits);

ExecutionOutcome MakeRejectedOutcome(const std::string& reason);

double ToMilliseconds(std::chrono::steady_clock::duration elapsed);

}  // namespace katabox::sandbox
