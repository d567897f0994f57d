#include "execution/execution_service.hpp"

#include <chrono>

#include "execution/error_classifier.hpp"
#include "execution/output_parser.hpp"
#include "script/entry_point_validator.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace scriptbox::execution {

ExecutionService::ExecutionService(const config::ServiceConfig& config,
                                   std::unique_ptr<sandbox::SandboxBackend> backend)
    : config_(config),
      backend_(std::move(backend)),
      executor_(config_, *backend_),
      gate_(config.execution.max_concurrent_runs,
            std::chrono::milliseconds(config.execution.admission_wait_ms)) {}

ExecutionResult ExecutionService::Execute(const ExecutionRequest& request) const {
    if (utils::Trim(request.script).empty()) {
        return InvalidInput("Invalid or missing 'script'");
    }

    script::ValidationOutcome outcome;
    try {
        outcome = script::ValidateEntryPoint(request.script);
    } catch (const script::SyntaxError& ex) {
        utils::Log(utils::LogLevel::kDebug, "exec", std::string("rejected: ") + ex.what());
        return FromSyntaxError(ex);
    }
    if (!outcome.has_entry_point) {
        utils::Log(utils::LogLevel::kDebug, "exec", "rejected: no main()");
        return MissingMain(outcome);
    }

    auto slot = gate_.TryAcquire();
    if (!slot) {
        utils::Log(utils::LogLevel::kWarn, "exec",
                   "rejected: " + std::to_string(gate_.Capacity()) + " runs already in flight");
        throw ServiceBusy("too many scripts are running, try again later");
    }

    const auto run = executor_.Run(request.script);
    auto parsed = ParseOutput(run, config_.execution.max_output_bytes);
    auto failure = ClassifyRun(run, parsed, executor_.Timeout());

    const std::string outcome_name = failure ? ToString(failure->kind) : "success";
    utils::Log(utils::LogLevel::kInfo, "exec",
               "outcome=" + outcome_name + " exit=" + std::to_string(run.exit_code) +
               " elapsed_ms=" + std::to_string(run.elapsed.count()));
    if (failure) {
        return std::move(*failure);
    }
    return ExecutionSuccess{std::move(*parsed.result), parsed.InformationalText()};
}

}  // namespace scriptbox::execution
