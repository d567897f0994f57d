#pragma once

#include <memory>
#include <stdexcept>

#include "config/config_schema.hpp"
#include "execution/admission_gate.hpp"
#include "execution/execution_result.hpp"
#include "sandbox/sandbox_backend.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace scriptbox::execution {

// Admission control refused the request.
class ServiceBusy : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// validate -> admit -> run -> parse -> classify. Safe to call from many
// threads at once; the only shared mutable state is the admission gate.
class ExecutionService {
public:
    ExecutionService(const config::ServiceConfig& config, std::unique_ptr<sandbox::SandboxBackend> backend);

    // Script problems come back as ExecutionFailure. Throws ServiceBusy and
    // sandbox::SandboxUnavailable.
    ExecutionResult Execute(const ExecutionRequest& request) const;

    const sandbox::SandboxBackend& Backend() const { return *backend_; }

private:
    const config::ServiceConfig& config_;
    std::unique_ptr<sandbox::SandboxBackend> backend_;
    sandbox::SandboxExecutor executor_;
    mutable AdmissionGate gate_;
};

}  // namespace scriptbox::execution
