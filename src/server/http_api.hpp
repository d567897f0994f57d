#pragma once

#include <optional>
#include <string>

#include "execution/execution_result.hpp"
#include "execution/execution_service.hpp"
#include "nlohmann/json.hpp"

namespace httplib {
class Server;
}

namespace scriptbox::server {

struct HttpReply {
    int status = 200;
    nlohmann::json body;
};

// Accepts exactly {"script": "<non-empty string>"}; other fields are ignored.
std::optional<execution::ExecutionRequest> ParseExecutionRequest(const std::string& body, std::string* error);

nlohmann::json ResultToJson(const execution::ExecutionResult& result);

// Status for a result: 200 on success, 400 for every script failure.
int StatusFor(const execution::ExecutionResult& result);

HttpReply HandleExecute(const execution::ExecutionService& service, const std::string& body);
HttpReply HandleHealth();

// Serializes with invalid UTF-8 replaced, since script output is arbitrary bytes.
std::string DumpJson(const nlohmann::json& body);

// POST /execute and GET /health.
void RegisterRoutes(httplib::Server& server, const execution::ExecutionService& service);

}  // namespace scriptbox::server
