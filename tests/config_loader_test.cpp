#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test_support.hpp"

namespace {

using ::testing::Contains;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

using namespace scriptbox::config;  // NOLINT

const char* const kOverrideVariables[] = {
    "SCRIPTBOX_CONFIG",
    "SCRIPTBOX_SERVER__PORT",
    "SCRIPTBOX_PORT",
    "SCRIPTBOX_SERVER__MAX_REQUEST_BYTES",
    "SCRIPTBOX_EXECUTION__TIMEOUT_MS",
    "SCRIPTBOX_TIMEOUT_MS",
    "SCRIPTBOX_EXECUTION__MAX_RESULT_BYTES",
    "SCRIPTBOX_EXECUTION__ADMISSION_WAIT_MS",
    "SCRIPTBOX_SANDBOX__BACKEND",
    "SCRIPTBOX_BACKEND",
    "SCRIPTBOX_SANDBOX__PYTHON_PATH",
    "SCRIPTBOX_SANDBOX__SCRATCH_ROOT",
    "SCRIPTBOX_SANDBOX__MEMORY_LIMIT_MB",
    "SCRIPTBOX_SANDBOX__CPU_LIMIT_S",
    "SCRIPTBOX_SANDBOX__MAX_PROCESSES",
    "SCRIPTBOX_SANDBOX__MAX_FILE_SIZE_MB",
    "SCRIPTBOX_LOGGING__LEVEL",
    "SCRIPTBOX_LOG_LEVEL",
};

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : kOverrideVariables) {
            unsetenv(name);
        }
        dir_ = scriptbox::test_support::MakeTempRoot("config");
    }

    void TearDown() override {
        for (const char* name : kOverrideVariables) {
            unsetenv(name);
        }
        std::filesystem::remove_all(dir_);
    }

    std::string WriteConfig(const std::string& content) {
        const auto path = dir_ / "config.json";
        std::ofstream(path) << content;
        return path.string();
    }

    std::filesystem::path dir_;
};

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, DefaultsWhenFileIsMissing) {
    const auto config = LoadConfig((dir_ / "absent.json").string());
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.execution.timeout_ms, 10000);
    EXPECT_EQ(config.execution.max_concurrent_runs, 0);
    EXPECT_EQ(config.sandbox.backend, "nsjail");
    EXPECT_EQ(config.sandbox.python_path, "/usr/bin/python3");
    EXPECT_THAT(config.sandbox.scratch_root, HasSubstr("scriptbox"));
    EXPECT_THAT(ValidateConfig(config), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, ReadsJsonSections) {
    const auto path = WriteConfig(R"({
        "server": {"port": 9090, "workerThreads": 2},
        "execution": {"timeoutMs": 2500, "maxConcurrentRuns": 3},
        "sandbox": {"backend": "rlimit", "memoryLimitMb": 256},
        "logging": {"level": "debug"}
    })");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.port, 9090);
    EXPECT_EQ(config.server.worker_threads, 2);
    EXPECT_EQ(config.execution.timeout_ms, 2500);
    EXPECT_EQ(config.execution.max_concurrent_runs, 3);
    EXPECT_EQ(config.sandbox.backend, "rlimit");
    EXPECT_EQ(config.sandbox.memory_limit_mb, 256);
    EXPECT_EQ(config.sandbox.python_path, "python3");
    EXPECT_EQ(config.logging.min_level, scriptbox::utils::LogLevel::kDebug);
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, WrongTypesKeepDefaults) {
    const auto path = WriteConfig(R"({"server": {"port": "80"}, "execution": {"timeoutMs": 1.5}})");
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.port, 8080);
    EXPECT_EQ(config.execution.timeout_ms, 10000);
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, InvalidJsonKeepsDefaults) {
    const auto config = LoadConfig(WriteConfig("{ not json"));
    EXPECT_EQ(config.execution.timeout_ms, 10000);
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const auto path = WriteConfig(R"({"execution": {"timeoutMs": 2500}})");
    setenv("SCRIPTBOX_EXECUTION__TIMEOUT_MS", "750", 1);
    setenv("SCRIPTBOX_SANDBOX__BACKEND", "rlimit", 1);
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.execution.timeout_ms, 750);
    EXPECT_EQ(config.sandbox.backend, "rlimit");
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, EnvironmentOverridesLimits) {
    const auto path = WriteConfig(R"({
        "execution": {"maxResultBytes": 4096},
        "sandbox": {"memoryLimitMb": 256, "maxProcesses": 8}
    })");
    setenv("SCRIPTBOX_SERVER__MAX_REQUEST_BYTES", "2048", 1);
    setenv("SCRIPTBOX_EXECUTION__MAX_RESULT_BYTES", "65536", 1);
    setenv("SCRIPTBOX_EXECUTION__ADMISSION_WAIT_MS", "300", 1);
    setenv("SCRIPTBOX_SANDBOX__MEMORY_LIMIT_MB", "128", 1);
    setenv("SCRIPTBOX_SANDBOX__CPU_LIMIT_S", "3", 1);
    setenv("SCRIPTBOX_SANDBOX__MAX_PROCESSES", "0", 1);
    setenv("SCRIPTBOX_SANDBOX__MAX_FILE_SIZE_MB", "not-a-number", 1);
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.max_request_bytes, 2048u);
    EXPECT_EQ(config.execution.max_result_bytes, 65536u);
    EXPECT_EQ(config.execution.admission_wait_ms, 300);
    EXPECT_EQ(config.sandbox.memory_limit_mb, 128);
    EXPECT_EQ(config.sandbox.cpu_limit_s, 3);
    EXPECT_EQ(config.sandbox.max_processes, 0);
    EXPECT_EQ(config.sandbox.max_file_size_mb, 16);
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, ConfigPathFromEnvironment) {
    const auto path = WriteConfig(R"({"server": {"port": 7000}})");
    setenv("SCRIPTBOX_CONFIG", path.c_str(), 1);
    EXPECT_EQ(ResolveConfigPath(""), std::filesystem::path(path));
    EXPECT_EQ(LoadConfig().server.port, 7000);
    EXPECT_EQ(ResolveConfigPath("/explicit.json"), std::filesystem::path("/explicit.json"));
}

// NOLINTNEXTLINE
TEST_F(ConfigLoaderTest, ValidationReportsEachProblem) {
    ServiceConfig config;
    config.server.port = 0;
    config.execution.timeout_ms = 0;
    config.sandbox.backend = "docker";
    const auto problems = ValidateConfig(config);
    EXPECT_EQ(problems.size(), 3u);
    EXPECT_THAT(problems, Contains(HasSubstr("server.port")));
    EXPECT_THAT(problems, Contains(HasSubstr("execution.timeoutMs")));
    EXPECT_THAT(problems, Contains(HasSubstr("\"docker\"")));
}

}  // namespace
