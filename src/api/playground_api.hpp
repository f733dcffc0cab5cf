#pragma once

#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "sandbox/execution_dispatcher.hpp"
#include "sandbox/execution_types.hpp"

namespace katabox::api {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

struct RunRequest {
    std::string code;
};

// Returns the request on success; on failure fills `error` with the 400
// response to send back.
std::optional<RunRequest> ParseRunRequest(const std::string& body, ApiResponse& error);

nlohmann::json OutcomeToJson(const katabox::sandbox::ExecutionOutcome& outcome);

ApiResponse HandleRun(katabox::sandbox::ExecutionDispatcher& dispatcher, const std::string& body);

nlohmann::json HealthJson(const katabox::sandbox::ExecutionDispatcher::Stats& stats);

// Captured output is arbitrary bytes; invalid UTF-8 is replaced rather than
// failing the whole response.
std::string Serialize(const nlohmann::json& body);

ApiResponse NotFound();

}  // namespace katabox::api
