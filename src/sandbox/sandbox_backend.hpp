#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace scriptbox::sandbox {

// The sandbox itself could not be used: missing binary, bad profile, failed
// fork/exec. Never caused by the script.
class SandboxUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Host paths prepared for one run.
struct RunLayout {
    std::filesystem::path driver_dir;
    std::filesystem::path work_dir;
};

struct LaunchCommand {
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
    // KEY=VALUE entries; the child inherits nothing else from the host.
    std::vector<std::string> environment;
};

// Turns "run the driver under isolation" into a concrete command line.
// Implementations hold only immutable settings and are shared by all
// requests.
class SandboxBackend {
public:
    virtual ~SandboxBackend() = default;

    virtual std::string Name() const = 0;

    // Throws SandboxUnavailable when the command cannot be built.
    virtual LaunchCommand Prepare(const RunLayout& layout, std::chrono::milliseconds timeout) const = 0;

    // Runs in the forked child right before exec. Only async-signal-safe
    // calls are allowed here.
    virtual void ApplyChildLimits() const {}

    // Returns a non-empty message when the exit status was produced by the
    // sandbox failing rather than by the script.
    virtual std::string DetectInfraFailure(int exit_code, const std::string& stderr_text) const {
        (void)exit_code;
        (void)stderr_text;
        return std::string();
    }
};

// Runs the interpreter through nsjail using the configured profile.
class NsjailBackend : public SandboxBackend {
public:
    explicit NsjailBackend(config::SandboxConfig config);

    std::string Name() const override { return "nsjail"; }
    LaunchCommand Prepare(const RunLayout& layout, std::chrono::milliseconds timeout) const override;
    std::string DetectInfraFailure(int exit_code, const std::string& stderr_text) const override;

private:
    config::SandboxConfig config_;
};

// Runs the host interpreter directly with setrlimit limits. No namespace
// isolation; meant for development and tests.
class RlimitBackend : public SandboxBackend {
public:
    explicit RlimitBackend(config::SandboxConfig config);

    std::string Name() const override { return "rlimit"; }
    LaunchCommand Prepare(const RunLayout& layout, std::chrono::milliseconds timeout) const override;
    void ApplyChildLimits() const override;
    std::string DetectInfraFailure(int exit_code, const std::string& stderr_text) const override;

private:
    config::SandboxConfig config_;
};

std::unique_ptr<SandboxBackend> CreateBackend(const config::SandboxConfig& config);

}  // namespace scriptbox::sandbox
