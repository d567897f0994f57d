#include "execution/error_classifier.hpp"

#include <cctype>
#include <csignal>
#include <cstring>
#include <sstream>

#include "sandbox/driver.hpp"
#include "utils/common.hpp"

namespace scriptbox::execution {
namespace {

// nsjail log lines look like "[I][2024-05-01T10:00:00+0000] ...".
bool IsSandboxLogLine(const std::string& line) {
    return line.size() >= 4 && line[0] == '[' && line[1] != '\0' &&
           std::strchr("DIWEF", line[1]) != nullptr && line[2] == ']' && line[3] == '[';
}

// Line number of the innermost traceback frame inside the script, 0 if none.
int LastScriptLine(const std::vector<std::string>& lines) {
    const std::string marker = std::string("File \"") + sandbox::kScriptFileName + "\", line ";
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        const auto pos = it->find(marker);
        if (pos == std::string::npos) {
            continue;
        }
        std::size_t digits = pos + marker.size();
        int number = 0;
        while (digits < it->size() && std::isdigit(static_cast<unsigned char>((*it)[digits]))) {
            number = number * 10 + ((*it)[digits] - '0');
            ++digits;
        }
        return number;
    }
    return 0;
}

std::string FormatSeconds(std::chrono::milliseconds timeout) {
    std::ostringstream oss;
    oss << static_cast<double>(timeout.count()) / 1000.0;
    return oss.str() + (timeout == std::chrono::seconds(1) ? " second" : " seconds");
}

std::string DescribeSignal(int signal) {
    switch (signal) {
        case SIGKILL:
            return "Script was killed (signal 9); it may have exceeded the memory limit";
        case SIGXCPU:
            return "Script exceeded the CPU time limit";
        case SIGXFSZ:
            return "Script exceeded the file size limit";
        case SIGSEGV:
            return "Script crashed with a segmentation fault";
        default:
            return "Script was terminated by signal " + std::to_string(signal);
    }
}

ExecutionFailure MakeFailure(ErrorKind kind, std::string message) {
    ExecutionFailure failure;
    failure.kind = kind;
    failure.message = std::move(message);
    failure.suggestions = SuggestionsFor(kind);
    return failure;
}

}  // namespace

const std::vector<std::string>& SuggestionsFor(ErrorKind kind) {
    static const std::vector<std::string> kInvalidInput = {
        "Send a JSON object with a non-empty string field \"script\"",
        "Set the Content-Type header to application/json"
    };
    static const std::vector<std::string> kSyntaxError = {
        "Check the reported line for typos, unbalanced brackets or a missing colon",
        "Keep indentation consistent and do not mix tabs and spaces",
        "Run python3 -m py_compile on the script locally to see the full error"
    };
    static const std::vector<std::string> kMissingMain = {
        "Define a top-level function named main() that returns the result",
        "main() must be defined at module level, not inside a class or another function",
        "If one of the available functions is the entry point, rename it to main"
    };
    static const std::vector<std::string> kRuntimeError = {
        "Read the error message and the line it points to",
        "Make sure main() returns a JSON-serializable value (str, int, float, bool, None, list or dict)",
        "Guard operations that can fail, such as division, indexing or dictionary lookups"
    };
    static const std::vector<std::string> kTimeout = {
        "Look for infinite loops or unbounded recursion",
        "Reduce the amount of work done in main()",
        "Avoid blocking calls such as input() or long time.sleep() calls"
    };
    switch (kind) {
        case ErrorKind::kInvalidInput: return kInvalidInput;
        case ErrorKind::kSyntaxError: return kSyntaxError;
        case ErrorKind::kMissingMain: return kMissingMain;
        case ErrorKind::kRuntimeError: return kRuntimeError;
        case ErrorKind::kTimeout: return kTimeout;
    }
    return kRuntimeError;
}

ExecutionFailure InvalidInput(const std::string& message) {
    return MakeFailure(ErrorKind::kInvalidInput, message);
}

ExecutionFailure FromSyntaxError(const script::SyntaxError& error) {
    const bool indentation = error.Message().find("indent") != std::string::npos;
    return MakeFailure(ErrorKind::kSyntaxError,
                       std::string(indentation ? "IndentationError: " : "SyntaxError: ") + error.what());
}

ExecutionFailure MissingMain(const script::ValidationOutcome& outcome) {
    std::string message = std::string("Script must define a ") + script::kEntryPointName + "() function";
    if (!outcome.other_functions.empty()) {
        message += " (found: " + utils::Join(outcome.other_functions, ", ") + ")";
    }
    auto failure = MakeFailure(ErrorKind::kMissingMain, message);
    failure.available_functions = outcome.other_functions;
    return failure;
}

std::vector<std::string> MeaningfulStderrLines(const std::string& stderr_text) {
    std::vector<std::string> lines;
    for (auto& line : utils::SplitLines(stderr_text)) {
        if (utils::Trim(line).empty() || IsSandboxLogLine(line)) {
            continue;
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

std::optional<ExecutionFailure> ClassifyRun(const sandbox::SandboxRun& run,
                                            const ParsedOutput& parsed,
                                            std::chrono::milliseconds timeout) {
    if (run.timed_out) {
        auto failure = MakeFailure(ErrorKind::kTimeout,
                                   "Script execution timed out after " + FormatSeconds(timeout));
        failure.output = parsed.InformationalText();
        failure.return_code = run.exit_code > 0 ? run.exit_code : 124;
        return failure;
    }

    if (run.exit_code != 0) {
        const auto lines = MeaningfulStderrLines(run.error);
        // Only the driver's compile step reports a syntax error; a SyntaxError
        // raised by eval() or ast.parse() at run time is a runtime error.
        const ErrorKind kind = run.exit_code == sandbox::kDriverExitCompileError ? ErrorKind::kSyntaxError
                                                                               : ErrorKind::kRuntimeError;
        std::string message;
        if (!lines.empty()) {
            message = utils::Trim(lines.back());
            const bool driver_message = run.exit_code == sandbox::kDriverExitNotSerializable ||
                                        run.exit_code == sandbox::kDriverExitNotCallable;
            const int line = driver_message ? 0 : LastScriptLine(lines);
            if (line > 0) {
                message += " (line " + std::to_string(line) + ")";
            }
        } else if (run.signal != 0) {
            message = DescribeSignal(run.signal);
        } else {
            message = "Script exited with code " + std::to_string(run.exit_code);
        }
        auto failure = MakeFailure(kind, message);
        failure.output = parsed.InformationalText();
        failure.return_code = run.exit_code;
        return failure;
    }

    if (!parsed.result) {
        auto failure = MakeFailure(ErrorKind::kRuntimeError, parsed.result_error);
        failure.output = parsed.InformationalText();
        failure.return_code = run.exit_code;
        return failure;
    }
    return std::nullopt;
}

}  // namespace scriptbox::execution
