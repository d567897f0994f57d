#include "sandbox/sandbox_backend.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <algorithm>
#include <boost/process/search_path.hpp>
#include <cstring>
#include <utility>

#include "sandbox/driver.hpp"
#include "utils/common.hpp"

namespace scriptbox::sandbox {
namespace {

constexpr const char* kJailDriverDir = "/sandbox/driver";
constexpr const char* kJailWorkDir = "/sandbox/work";
constexpr const char* kChildPath = "/usr/local/bin:/usr/bin:/bin";

std::string ResolveExecutable(const std::string& name, const char* what) {
    if (name.empty()) {
        throw SandboxUnavailable(std::string(what) + " path is empty");
    }
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) != 0) {
            throw SandboxUnavailable(std::string(what) + " is not executable: " + name);
        }
        return name;
    }
    const auto found = boost::process::search_path(name);
    if (found.empty()) {
        throw SandboxUnavailable(std::string(what) + " not found in PATH: " + name);
    }
    return found.string();
}

std::vector<std::string> ChildEnvironment(const std::string& home) {
    return {
        std::string("PATH=") + kChildPath,
        "HOME=" + home,
        "LANG=C.UTF-8",
        "LC_ALL=C.UTF-8"
    };
}

void AppendLimit(std::vector<std::string>& args, const char* flag, int value) {
    if (value > 0) {
        args.emplace_back(flag);
        args.push_back(std::to_string(value));
    }
}

// Lowers the limit; never tries to raise the hard limit.
bool SetLimit(int resource, rlim_t value) {
    struct rlimit current {};
    if (::getrlimit(resource, &current) != 0) {
        return false;
    }
    struct rlimit limit {};
    limit.rlim_max = current.rlim_max == RLIM_INFINITY ? value : std::min(current.rlim_max, value);
    limit.rlim_cur = limit.rlim_max;
    return ::setrlimit(resource, &limit) == 0;
}

[[noreturn]] void FailChildSetup(const char* message) {
    const char prefix[] = "scriptbox: ";
    ssize_t ignored = ::write(STDERR_FILENO, prefix, sizeof(prefix) - 1);
    ignored = ::write(STDERR_FILENO, message, std::strlen(message));
    ignored = ::write(STDERR_FILENO, "\n", 1);
    (void)ignored;
    ::_exit(kChildSetupFailureExit);
}

}  // namespace

NsjailBackend::NsjailBackend(config::SandboxConfig config)
    : config_(std::move(config)) {}

LaunchCommand NsjailBackend::Prepare(const RunLayout& layout, std::chrono::milliseconds timeout) const {
    LaunchCommand command;
    command.executable = ResolveExecutable(config_.nsjail_path, "nsjail");
    if (::access(config_.profile_path.c_str(), R_OK) != 0) {
        throw SandboxUnavailable("nsjail profile is not readable: " + config_.profile_path);
    }

    // Inner limit only; the executor's wall clock fires first.
    const auto time_limit_s = (timeout.count() + 999) / 1000 + 1;
    const std::string jail_driver_dir = kJailDriverDir;

    auto& args = command.args;
    args = {
        "--config", config_.profile_path,
        "--quiet",
        "--time_limit", std::to_string(time_limit_s),
        "--pass_fd", std::to_string(kResultChannelFd),
        "--bindmount_ro", layout.driver_dir.string() + ":" + jail_driver_dir,
        "--bindmount", layout.work_dir.string() + ":" + kJailWorkDir,
        "--cwd", kJailWorkDir
    };
    AppendLimit(args, "--rlimit_as", config_.memory_limit_mb);
    AppendLimit(args, "--rlimit_cpu", config_.cpu_limit_s);
    AppendLimit(args, "--rlimit_fsize", config_.max_file_size_mb);
    AppendLimit(args, "--rlimit_nproc", config_.max_processes);
    for (const auto& entry : ChildEnvironment(kJailWorkDir)) {
        args.emplace_back("--env");
        args.push_back(entry);
    }
    args.emplace_back("--");
    args.push_back(config_.python_path);
    for (auto& arg : InterpreterArgs(jail_driver_dir + "/" + kDriverFileName)) {
        args.push_back(std::move(arg));
    }

    command.working_dir = layout.work_dir.string();
    command.environment = {std::string("PATH=") + kChildPath};
    return command;
}

std::string NsjailBackend::DetectInfraFailure(int exit_code, const std::string& stderr_text) const {
    // nsjail exits with 255 when it fails before or while setting up the jail
    // and logs the reason as an [E] or [F] line.
    if (exit_code != 255) {
        return std::string();
    }
    for (const auto& line : utils::SplitLines(stderr_text)) {
        if (utils::StartsWith(line, "[E]") || utils::StartsWith(line, "[F]")) {
            return "nsjail failed: " + line;
        }
    }
    return std::string();
}

RlimitBackend::RlimitBackend(config::SandboxConfig config)
    : config_(std::move(config)) {}

LaunchCommand RlimitBackend::Prepare(const RunLayout& layout, std::chrono::milliseconds timeout) const {
    (void)timeout;
    LaunchCommand command;
    command.executable = ResolveExecutable(config_.python_path, "python interpreter");
    command.args = InterpreterArgs(layout.driver_dir / kDriverFileName);
    command.working_dir = layout.work_dir.string();
    command.environment = ChildEnvironment(layout.work_dir.string());
    return command;
}

void RlimitBackend::ApplyChildLimits() const {
    constexpr rlim_t kMiB = 1024 * 1024;
    if (!SetLimit(RLIMIT_CORE, 0)) {
        FailChildSetup("setrlimit(RLIMIT_CORE) failed");
    }
    if (config_.memory_limit_mb > 0 &&
        !SetLimit(RLIMIT_AS, static_cast<rlim_t>(config_.memory_limit_mb) * kMiB)) {
        FailChildSetup("setrlimit(RLIMIT_AS) failed");
    }
    if (config_.cpu_limit_s > 0 && !SetLimit(RLIMIT_CPU, static_cast<rlim_t>(config_.cpu_limit_s))) {
        FailChildSetup("setrlimit(RLIMIT_CPU) failed");
    }
    if (config_.max_file_size_mb > 0 &&
        !SetLimit(RLIMIT_FSIZE, static_cast<rlim_t>(config_.max_file_size_mb) * kMiB)) {
        FailChildSetup("setrlimit(RLIMIT_FSIZE) failed");
    }
    if (config_.max_processes > 0 && !SetLimit(RLIMIT_NPROC, static_cast<rlim_t>(config_.max_processes))) {
        FailChildSetup("setrlimit(RLIMIT_NPROC) failed");
    }
}

std::string RlimitBackend::DetectInfraFailure(int exit_code, const std::string& stderr_text) const {
    if (exit_code != kChildSetupFailureExit) {
        return std::string();
    }
    for (const auto& line : utils::SplitLines(stderr_text)) {
        if (utils::StartsWith(line, "scriptbox: ")) {
            return line;
        }
    }
    return std::string();
}

std::unique_ptr<SandboxBackend> CreateBackend(const config::SandboxConfig& config) {
    if (config.backend == "nsjail") {
        return std::make_unique<NsjailBackend>(config);
    }
    if (config.backend == "rlimit") {
        return std::make_unique<RlimitBackend>(config);
    }
    throw SandboxUnavailable("unknown sandbox backend: " + config.backend);
}

}  // namespace scriptbox::sandbox
