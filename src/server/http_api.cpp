#include "server/http_api.hpp"

#include <variant>

#include "execution/error_classifier.hpp"
#include "httplib.h"
#include "sandbox/sandbox_backend.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::server {
namespace {

HttpReply ServiceError(int status, const char* error, const std::string& message) {
    nlohmann::json body = {
        {"success", false},
        {"error", error},
        {"message", message}
    };
    return HttpReply{status, std::move(body)};
}

}  // namespace

std::optional<execution::ExecutionRequest> ParseExecutionRequest(const std::string& body, std::string* error) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        *error = "Request body must be a JSON object";
        return std::nullopt;
    }
    if (!data.contains("script") || !data["script"].is_string()) {
        *error = "Invalid or missing 'script'";
        return std::nullopt;
    }
    auto script = data["script"].get<std::string>();
    if (utils::Trim(script).empty()) {
        *error = "Invalid or missing 'script'";
        return std::nullopt;
    }
    return execution::ExecutionRequest{std::move(script)};
}

nlohmann::json ResultToJson(const execution::ExecutionResult& result) {
    if (const auto* success = std::get_if<execution::ExecutionSuccess>(&result)) {
        return {
            {"success", true},
            {"result", success->result},
            {"stdout", success->output}
        };
    }
    const auto& failure = std::get<execution::ExecutionFailure>(result);
    nlohmann::json json = {
        {"success", false},
        {"error", execution::ToString(failure.kind)},
        {"message", failure.message},
        {"stdout", failure.output},
        {"suggestions", failure.suggestions},
        {"return_code", failure.return_code}
    };
    if (failure.kind == execution::ErrorKind::kMissingMain) {
        json["available_functions"] = failure.available_functions;
    }
    return json;
}

int StatusFor(const execution::ExecutionResult& result) {
    return execution::IsSuccess(result) ? 200 : 400;
}

HttpReply HandleExecute(const execution::ExecutionService& service, const std::string& body) {
    std::string error;
    const auto request = ParseExecutionRequest(body, &error);
    if (!request) {
        const execution::ExecutionResult invalid = execution::InvalidInput(error);
        return HttpReply{StatusFor(invalid), ResultToJson(invalid)};
    }

    try {
        const auto result = service.Execute(*request);
        return HttpReply{StatusFor(result), ResultToJson(result)};
    } catch (const execution::ServiceBusy& ex) {
        return ServiceError(503, "busy", ex.what());
    } catch (const sandbox::SandboxUnavailable& ex) {
        utils::Log(utils::LogLevel::kError, "server", std::string("sandbox unavailable: ") + ex.what());
        return ServiceError(500, "internal_error", "The execution sandbox is unavailable");
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "server", std::string("execute failed: ") + ex.what());
        return ServiceError(500, "internal_error", "Internal server error");
    }
}

HttpReply HandleHealth() {
    nlohmann::json body = nlohmann::json::object();
    body["status"] = "ok";
    return HttpReply{200, std::move(body)};
}

std::string DumpJson(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void RegisterRoutes(httplib::Server& server, const execution::ExecutionService& service) {
    server.Post("/execute", [&service](const httplib::Request& req, httplib::Response& res) {
        const auto reply = HandleExecute(service, req.body);
        res.status = reply.status;
        res.set_content(DumpJson(reply.body), "application/json");
    });

    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        const auto reply = HandleHealth();
        res.status = reply.status;
        res.set_content(DumpJson(reply.body), "application/json");
    });
}

}  // namespace scriptbox::server
