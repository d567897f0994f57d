#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "execution/execution_result.hpp"
#include "execution/output_parser.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "script/entry_point_validator.hpp"

namespace scriptbox::execution {

// Fixed remediation hints for each kind.
const std::vector<std::string>& SuggestionsFor(ErrorKind kind);

ExecutionFailure InvalidInput(const std::string& message);
ExecutionFailure FromSyntaxError(const script::SyntaxError& error);
ExecutionFailure MissingMain(const script::ValidationOutcome& outcome);

// stderr lines with blank lines and sandbox log lines removed.
std::vector<std::string> MeaningfulStderrLines(const std::string& stderr_text);

// Returns nullopt when the run finished and produced a decodable result.
std::optional<ExecutionFailure> ClassifyRun(const sandbox::SandboxRun& run,
                                            const ParsedOutput& parsed,
                                            std::chrono::milliseconds timeout);

}  // namespace scriptbox::execution
