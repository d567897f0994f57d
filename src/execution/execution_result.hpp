#pragma once

#include <string>
#include <variant>
#include <vector>

#include "nlohmann/json.hpp"

namespace scriptbox::execution {

enum class ErrorKind {
    kInvalidInput,
    kSyntaxError,
    kMissingMain,
    kRuntimeError,
    kTimeout
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidInput: return "invalid_input";
        case ErrorKind::kSyntaxError: return "syntax_error";
        case ErrorKind::kMissingMain: return "missing_main";
        case ErrorKind::kRuntimeError: return "runtime_error";
        case ErrorKind::kTimeout: return "timeout";
    }
    return "unknown";
}

struct ExecutionRequest {
    std::string script;
};

struct ExecutionSuccess {
    nlohmann::json result;
    std::string output;
};

struct ExecutionFailure {
    ErrorKind kind = ErrorKind::kRuntimeError;
    std::string message;
    std::vector<std::string> suggestions;
    // Only filled for kMissingMain.
    std::vector<std::string> available_functions;
    std::string output;
    // -1 when no process was started.
    int return_code = -1;
};

using ExecutionResult = std::variant<ExecutionSuccess, ExecutionFailure>;

inline bool IsSuccess(const ExecutionResult& result) {
    return std::holds_alternative<ExecutionSuccess>(result);
}

}  // namespace scriptbox::execution
