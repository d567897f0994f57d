#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/sandbox_backend.hpp"

namespace scriptbox::sandbox {

struct SandboxRun {
    int exit_code = -1;
    // Terminating signal, 0 when the process exited normally.
    int signal = 0;
    bool timed_out = false;
    std::string output;
    std::string error;
    bool output_truncated = false;
    bool error_truncated = false;
    // Bytes the driver wrote to the result channel; nullopt when it wrote
    // nothing.
    std::optional<std::string> result_channel;
    bool result_overflow = false;
    std::chrono::milliseconds elapsed{0};
};

class SandboxExecutor {
public:
    SandboxExecutor(const config::ServiceConfig& config, const SandboxBackend& backend);

    // Runs script.py through the driver under the backend. Every process in
    // the run's process group is gone and the scratch tree removed when this
    // returns. Throws SandboxUnavailable for infrastructure failures only.
    SandboxRun Run(const std::string& script) const;

    std::chrono::milliseconds Timeout() const { return timeout_; }

private:
    const config::ServiceConfig& config_;
    const SandboxBackend& backend_;
    std::chrono::milliseconds timeout_;
};

}  // namespace scriptbox::sandbox
