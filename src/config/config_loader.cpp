#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace scriptbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

int ParseInt(const std::string& value, int fallback) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
}

std::size_t ParseSize(const std::string& value, std::size_t fallback) {
    try {
        return static_cast<std::size_t>(std::stoull(value));
    } catch (const std::exception&) {
        utils::Log(utils::LogLevel::kWarn, "config", "ignoring non-numeric value '" + value + "'");
        return fallback;
    }
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ReadSize(const nlohmann::json& section, const char* key, std::size_t& target) {
    if (section.contains(key) && section[key].is_number_unsigned()) {
        target = section[key].get<std::size_t>();
    }
}

void ApplyConfigFromJson(ServiceConfig& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ReadString(server, "host", config.server.host);
        ReadInt(server, "port", config.server.port);
        ReadInt(server, "workerThreads", config.server.worker_threads);
        ReadSize(server, "maxRequestBytes", config.server.max_request_bytes);
    }

    if (data.contains("execution") && data["execution"].is_object()) {
        const auto& execution = data["execution"];
        ReadInt(execution, "timeoutMs", config.execution.timeout_ms);
        ReadSize(execution, "maxOutputBytes", config.execution.max_output_bytes);
        ReadSize(execution, "maxResultBytes", config.execution.max_result_bytes);
        ReadInt(execution, "maxConcurrentRuns", config.execution.max_concurrent_runs);
        ReadInt(execution, "admissionWaitMs", config.execution.admission_wait_ms);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "backend", config.sandbox.backend);
        ReadString(sandbox, "nsjailPath", config.sandbox.nsjail_path);
        ReadString(sandbox, "profilePath", config.sandbox.profile_path);
        ReadString(sandbox, "pythonPath", config.sandbox.python_path);
        ReadString(sandbox, "scratchRoot", config.sandbox.scratch_root);
        ReadInt(sandbox, "memoryLimitMb", config.sandbox.memory_limit_mb);
        ReadInt(sandbox, "cpuLimitS", config.sandbox.cpu_limit_s);
        ReadInt(sandbox, "maxProcesses", config.sandbox.max_processes);
        ReadInt(sandbox, "maxFileSizeMb", config.sandbox.max_file_size_mb);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        const auto& logging = data["logging"];
        if (logging.contains("level") && logging["level"].is_string()) {
            const auto value = logging["level"].get<std::string>();
            if (!utils::ParseLogLevel(value, &config.logging.min_level)) {
                utils::Log(utils::LogLevel::kWarn, "config", "unknown log level '" + value + "'");
            }
        }
    }
}

void ApplyEnvOverrides(ServiceConfig& config) {
    const auto host = GetEnvFallback("SCRIPTBOX_SERVER__HOST", "SCRIPTBOX_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }

    const auto port = GetEnvFallback("SCRIPTBOX_SERVER__PORT", "SCRIPTBOX_PORT");
    if (!port.empty()) {
        config.server.port = ParseInt(port, config.server.port);
    }

    const auto worker_threads = GetEnv("SCRIPTBOX_SERVER__WORKER_THREADS");
    if (!worker_threads.empty()) {
        config.server.worker_threads = ParseInt(worker_threads, config.server.worker_threads);
    }

    const auto max_request = GetEnv("SCRIPTBOX_SERVER__MAX_REQUEST_BYTES");
    if (!max_request.empty()) {
        config.server.max_request_bytes = ParseSize(max_request, config.server.max_request_bytes);
    }

    const auto timeout = GetEnvFallback("SCRIPTBOX_EXECUTION__TIMEOUT_MS", "SCRIPTBOX_TIMEOUT_MS");
    if (!timeout.empty()) {
        config.execution.timeout_ms = ParseInt(timeout, config.execution.timeout_ms);
    }

    const auto max_output = GetEnv("SCRIPTBOX_EXECUTION__MAX_OUTPUT_BYTES");
    if (!max_output.empty()) {
        config.execution.max_output_bytes = ParseSize(max_output, config.execution.max_output_bytes);
    }

    const auto max_result = GetEnv("SCRIPTBOX_EXECUTION__MAX_RESULT_BYTES");
    if (!max_result.empty()) {
        config.execution.max_result_bytes = ParseSize(max_result, config.execution.max_result_bytes);
    }

    const auto max_concurrent = GetEnv("SCRIPTBOX_EXECUTION__MAX_CONCURRENT_RUNS");
    if (!max_concurrent.empty()) {
        config.execution.max_concurrent_runs = ParseInt(
            max_concurrent,
            config.execution.max_concurrent_runs);
    }

    const auto admission_wait = GetEnv("SCRIPTBOX_EXECUTION__ADMISSION_WAIT_MS");
    if (!admission_wait.empty()) {
        config.execution.admission_wait_ms = ParseInt(admission_wait, config.execution.admission_wait_ms);
    }

    const auto backend = GetEnvFallback("SCRIPTBOX_SANDBOX__BACKEND", "SCRIPTBOX_BACKEND");
    if (!backend.empty()) {
        config.sandbox.backend = backend;
    }

    const auto nsjail_path = GetEnv("SCRIPTBOX_SANDBOX__NSJAIL_PATH");
    if (!nsjail_path.empty()) {
        config.sandbox.nsjail_path = nsjail_path;
    }

    const auto profile_path = GetEnv("SCRIPTBOX_SANDBOX__PROFILE_PATH");
    if (!profile_path.empty()) {
        config.sandbox.profile_path = profile_path;
    }

    const auto python_path = GetEnv("SCRIPTBOX_SANDBOX__PYTHON_PATH");
    if (!python_path.empty()) {
        config.sandbox.python_path = python_path;
    }

    const auto scratch_root = GetEnv("SCRIPTBOX_SANDBOX__SCRATCH_ROOT");
    if (!scratch_root.empty()) {
        config.sandbox.scratch_root = scratch_root;
    }

    const auto memory_limit = GetEnv("SCRIPTBOX_SANDBOX__MEMORY_LIMIT_MB");
    if (!memory_limit.empty()) {
        config.sandbox.memory_limit_mb = ParseInt(memory_limit, config.sandbox.memory_limit_mb);
    }

    const auto cpu_limit = GetEnv("SCRIPTBOX_SANDBOX__CPU_LIMIT_S");
    if (!cpu_limit.empty()) {
        config.sandbox.cpu_limit_s = ParseInt(cpu_limit, config.sandbox.cpu_limit_s);
    }

    const auto max_processes = GetEnv("SCRIPTBOX_SANDBOX__MAX_PROCESSES");
    if (!max_processes.empty()) {
        config.sandbox.max_processes = ParseInt(max_processes, config.sandbox.max_processes);
    }

    const auto max_file_size = GetEnv("SCRIPTBOX_SANDBOX__MAX_FILE_SIZE_MB");
    if (!max_file_size.empty()) {
        config.sandbox.max_file_size_mb = ParseInt(max_file_size, config.sandbox.max_file_size_mb);
    }

    const auto log_level = GetEnvFallback("SCRIPTBOX_LOGGING__LEVEL", "SCRIPTBOX_LOG_LEVEL");
    if (!log_level.empty() && !utils::ParseLogLevel(log_level, &config.logging.min_level)) {
        utils::Log(utils::LogLevel::kWarn, "config", "unknown log level '" + log_level + "'");
    }
}

void FillDerivedDefaults(ServiceConfig& config) {
    if (config.sandbox.python_path.empty()) {
        config.sandbox.python_path = config.sandbox.backend == "nsjail" ? "/usr/bin/python3" : "python3";
    }
    if (config.sandbox.scratch_root.empty()) {
        std::error_code ec;
        auto temp = std::filesystem::temp_directory_path(ec);
        if (ec) {
            temp = "/tmp";
        }
        config.sandbox.scratch_root = (temp / "scriptbox").string();
    }
}

}  // namespace

std::filesystem::path ResolveConfigPath(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    const auto from_env = GetEnv("SCRIPTBOX_CONFIG");
    if (!from_env.empty()) {
        return from_env;
    }
    return GetHomePath() / ".scriptbox" / "config.json";
}

ServiceConfig LoadConfig(const std::string& explicit_path) {
    ServiceConfig config{};

    const auto config_path = ResolveConfigPath(explicit_path);
    if (std::filesystem::exists(config_path)) {
        std::ifstream input(config_path);
        if (!input.is_open()) {
            utils::Log(utils::LogLevel::kWarn, "config", "cannot open " + config_path.string());
        } else {
            try {
                nlohmann::json data;
                input >> data;
                ApplyConfigFromJson(config, data);
            } catch (const nlohmann::json::exception& ex) {
                utils::Log(utils::LogLevel::kWarn, "config",
                           "keeping defaults, " + config_path.string() + " is invalid: " + ex.what());
            }
        }
    } else if (!explicit_path.empty()) {
        utils::Log(utils::LogLevel::kWarn, "config", config_path.string() + " does not exist");
    }

    ApplyEnvOverrides(config);
    FillDerivedDefaults(config);
    return config;
}

std::vector<std::string> ValidateConfig(const ServiceConfig& config) {
    std::vector<std::string> problems;
    if (config.server.port <= 0 || config.server.port > 65535) {
        problems.push_back("server.port must be between 1 and 65535");
    }
    if (config.server.worker_threads <= 0) {
        problems.push_back("server.workerThreads must be positive");
    }
    if (config.execution.timeout_ms <= 0) {
        problems.push_back("execution.timeoutMs must be positive");
    }
    if (config.execution.max_output_bytes == 0) {
        problems.push_back("execution.maxOutputBytes must be positive");
    }
    if (config.execution.max_result_bytes == 0) {
        problems.push_back("execution.maxResultBytes must be positive");
    }
    if (config.execution.max_concurrent_runs < 0) {
        problems.push_back("execution.maxConcurrentRuns must not be negative");
    }
    if (config.execution.admission_wait_ms < 0) {
        problems.push_back("execution.admissionWaitMs must not be negative");
    }
    if (config.sandbox.backend != "nsjail" && config.sandbox.backend != "rlimit") {
        problems.push_back("sandbox.backend must be \"nsjail\" or \"rlimit\", got \"" +
                           config.sandbox.backend + "\"");
    }
    if (config.sandbox.backend == "nsjail" && config.sandbox.profile_path.empty()) {
        problems.push_back("sandbox.profilePath is required for the nsjail backend");
    }
    if (config.sandbox.memory_limit_mb < 0 || config.sandbox.cpu_limit_s < 0 ||
        config.sandbox.max_processes < 0 || config.sandbox.max_file_size_mb < 0) {
        problems.push_back("sandbox limits must not be negative");
    }
    return problems;
}

}  // namespace scriptbox::config
