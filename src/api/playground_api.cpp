#include "api/playground_api.hpp"

#include <exception>
#include <future>

#include "utils/logging.hpp"

namespace katabox::api {
namespace {

ApiResponse ErrorResponse(int status, const std::string& message) {
    return ApiResponse{status, nlohmann::json{{"error", message}}};
}

template <typename T>
nlohmann::json OptionalJson(const std::optional<T>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

std::optional<RunRequest> ParseRunRequest(const std::string& body, ApiResponse& error) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        error = ErrorResponse(400, "invalid request body");
        return std::nullopt;
    }
    if (!data.contains("code") || !data["code"].is_string()) {
        error = ErrorResponse(400, "code is required");
        return std::nullopt;
    }
    RunRequest request{};
    request.code = data["code"].get<std::string>();
    return request;
}

nlohmann::json OutcomeToJson(const katabox::sandbox::ExecutionOutcome& outcome) {
    nlohmann::json json = nlohmann::json::object();
    json["stdout"] = outcome.stdout_data;
    json["stderr"] = outcome.stderr_data;
    json["success"] = outcome.success;
    json["execution_time_ms"] = outcome.elapsed_ms;
    json["error"] = OptionalJson(outcome.error);
    json["status"] = katabox::sandbox::ToString(outcome.status);
    json["exit_code"] = OptionalJson(outcome.exit_code);
    json["signal"] = OptionalJson(outcome.term_signal);
    json["stdout_truncated"] = outcome.stdout_truncated;
    json["stderr_truncated"] = outcome.stderr_truncated;
    return json;
}

ApiResponse HandleRun(katabox::sandbox::ExecutionDispatcher& dispatcher, const std::string& body) {
    ApiResponse error{};
    const auto request = ParseRunRequest(body, error);
    if (!request) {
        return error;
    }
    try {
        auto outcome = dispatcher.Execute(request->code).get();
        return ApiResponse{200, OutcomeToJson(outcome)};
    } catch (const std::future_error& ex) {
        utils::Log(utils::LogLevel::kError, "http", std::string("execution lost: ") + ex.what());
        return ErrorResponse(500, "internal error");
    }
}

nlohmann::json HealthJson(const katabox::sandbox::ExecutionDispatcher::Stats& stats) {
    return nlohmann::json{
        {"status", "ok"},
        {"active", stats.active},
        {"queued", stats.queued},
        {"completed", stats.completed},
        {"rejected", stats.rejected}
    };
}

std::string Serialize(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ApiResponse NotFound() {
    return ErrorResponse(404, "not found");
}

}  // namespace katabox::api
