#include "sandbox/sandbox_executor.hpp"

#include <signal.h>

#include <cerrno>
#include <future>
#include <thread>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/driver.hpp"
#include "test_support.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;

using namespace scriptbox;  // NOLINT

bool ProcessGone(pid_t pid) {
    // The orphan is reaped by init shortly after the group is killed.
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(pid, 0) != 0 && errno == ESRCH) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return false;
}

class SandboxExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        python_ = test_support::FindPython();
        if (python_.empty()) {
            GTEST_SKIP() << "python3 not found";
        }
        scratch_ = test_support::MakeTempRoot("executor");
        config_ = test_support::RlimitConfig(python_, scratch_);
    }

    void TearDown() override {
        if (!scratch_.empty()) {
            std::filesystem::remove_all(scratch_);
        }
    }

    sandbox::SandboxRun Run(const std::string& script) {
        const sandbox::RlimitBackend backend(config_.sandbox);
        const sandbox::SandboxExecutor executor(config_, backend);
        return executor.Run(script);
    }

    std::string python_;
    std::filesystem::path scratch_;
    config::ServiceConfig config_;
};

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ReturnsResultThroughChannel) {
    const auto run = Run("def main():\n    return \"Hello, World!\"\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_FALSE(run.timed_out);
    EXPECT_EQ(run.output, "");
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "\"Hello, World!\"");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, PrintedOutputStaysOnStdout) {
    const auto run = Run("def main():\n    print(\"Processing...\")\n    return 15\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_EQ(run.output, "Processing...\n");
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "15");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ExceptionHasNoResult) {
    const auto run = Run("def main():\n    return 10/0\n");
    EXPECT_EQ(run.exit_code, sandbox::kDriverExitException);
    EXPECT_THAT(run.error, HasSubstr("ZeroDivisionError"));
    EXPECT_THAT(run.error, HasSubstr("File \"script.py\", line 2"));
    EXPECT_THAT(run.error, Not(HasSubstr("driver.py")));
    EXPECT_FALSE(run.result_channel.has_value());
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, UnserializableResult) {
    const auto run = Run("def main():\n    return {1, 2}\n");
    EXPECT_EQ(run.exit_code, sandbox::kDriverExitNotSerializable);
    EXPECT_THAT(run.error, HasSubstr("not JSON serializable"));
    EXPECT_FALSE(run.result_channel.has_value());
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, CompileFailureHasItsOwnExitCode) {
    const auto run = Run("def main():\n    x = = 1\n    return x\n");
    EXPECT_EQ(run.exit_code, sandbox::kDriverExitCompileError);
    EXPECT_THAT(run.error, HasSubstr("SyntaxError"));
    EXPECT_THAT(run.error, HasSubstr("File \"script.py\", line 2"));
    EXPECT_FALSE(run.result_channel.has_value());
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, SyntaxErrorFromEvalIsAnException) {
    const auto run = Run("def main():\n    return eval(\"1 +\")\n");
    EXPECT_EQ(run.exit_code, sandbox::kDriverExitException);
    EXPECT_THAT(run.error, HasSubstr("SyntaxError"));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, SystemExitIsAnException) {
    const auto run = Run("import sys\ndef main():\n    sys.exit(3)\n");
    EXPECT_EQ(run.exit_code, sandbox::kDriverExitException);
    EXPECT_THAT(run.error, HasSubstr("SystemExit: 3"));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ScriptIsARegisteredModule) {
    const auto run = Run(
        "from __future__ import annotations\n"
        "import pickle\n"
        "from dataclasses import dataclass\n"
        "from typing import ClassVar\n"
        "\n"
        "@dataclass\n"
        "class Point:\n"
        "    dimensions: ClassVar[int] = 2\n"
        "    x: int = 0\n"
        "    y: int = 0\n"
        "\n"
        "def main():\n"
        "    copy = pickle.loads(pickle.dumps(Point(3, 4)))\n"
        "    return [copy.x, copy.y, Point.dimensions, Point.__module__]\n");
    EXPECT_EQ(run.exit_code, 0) << run.error;
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "[3, 4, 2, \"__script__\"]");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, BytesWrittenToChannelByScriptAreDropped) {
    const auto run = Run(
        "import os\n"
        "def main():\n"
        "    os.write(3, b'\"forged\"')\n"
        "    return None\n");
    EXPECT_EQ(run.exit_code, 0) << run.error;
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "null");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ClosingChannelFdDoesNotLoseResult) {
    const auto run = Run("import os\ndef main():\n    os.close(3)\n    return 7\n");
    EXPECT_EQ(run.exit_code, 0) << run.error;
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "7");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ScriptSeesPrivateWorkDirAndScriptName) {
    const auto run = Run(
        "import os\n"
        "def main():\n"
        "    with open('scratch.txt', 'w') as handle:\n"
        "        handle.write('x')\n"
        "    return [os.path.basename(os.getcwd()), __name__]\n");
    EXPECT_EQ(run.exit_code, 0) << run.error;
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "[\"work\", \"__script__\"]");
    EXPECT_TRUE(test_support::IsEmptyDirectory(scratch_));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, TimeoutKillsTheProcessTree) {
    config_.execution.timeout_ms = 1000;
    const auto run = Run(
        "import subprocess, sys\n"
        "def main():\n"
        "    child = subprocess.Popen([sys.executable, '-c', 'import time; time.sleep(60)'])\n"
        "    print(child.pid, flush=True)\n"
        "    while True:\n"
        "        pass\n");
    EXPECT_TRUE(run.timed_out);
    EXPECT_GE(run.elapsed, std::chrono::milliseconds(1000));
    EXPECT_LT(run.elapsed, std::chrono::milliseconds(3000));
    EXPECT_FALSE(run.result_channel.has_value());

    ASSERT_FALSE(run.output.empty());
    const auto pid = static_cast<pid_t>(std::stol(run.output));
    EXPECT_TRUE(ProcessGone(pid));
    EXPECT_TRUE(test_support::IsEmptyDirectory(scratch_));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, BackgroundProcessesDieWithTheRun) {
    const auto run = Run(
        "import subprocess, sys\n"
        "def main():\n"
        "    child = subprocess.Popen([sys.executable, '-c', 'import time; time.sleep(60)'],\n"
        "                             stdout=subprocess.DEVNULL, stderr=subprocess.DEVNULL)\n"
        "    return child.pid\n");
    EXPECT_EQ(run.exit_code, 0) << run.error;
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_TRUE(ProcessGone(static_cast<pid_t>(std::stol(*run.result_channel))));
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, OutputIsCapped) {
    config_.execution.max_output_bytes = 1000;
    const auto run = Run("def main():\n    print('x' * 100000)\n    return 1\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_TRUE(run.output_truncated);
    EXPECT_EQ(run.output.size(), 1000u);
    ASSERT_TRUE(run.result_channel.has_value());
    EXPECT_EQ(*run.result_channel, "1");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, OversizedResultIsFlagged) {
    config_.execution.max_result_bytes = 100;
    const auto run = Run("def main():\n    return 'y' * 1000\n");
    EXPECT_EQ(run.exit_code, 0);
    EXPECT_TRUE(run.result_overflow);
    EXPECT_FALSE(run.result_channel.has_value());
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, ConcurrentRunsAreIndependent) {
    const std::string script =
        "import os\n"
        "def main():\n"
        "    open('marker', 'a').write('x')\n"
        "    return os.path.getsize('marker')\n";
    auto first = std::async(std::launch::async, [&] { return Run(script); });
    auto second = std::async(std::launch::async, [&] { return Run(script); });
    const auto a = first.get();
    const auto b = second.get();
    ASSERT_TRUE(a.result_channel.has_value()) << a.error;
    ASSERT_TRUE(b.result_channel.has_value()) << b.error;
    EXPECT_EQ(*a.result_channel, "1");
    EXPECT_EQ(*b.result_channel, "1");
}

// NOLINTNEXTLINE
TEST_F(SandboxExecutorTest, MissingInterpreterIsInfrastructureFailure) {
    config_.sandbox.python_path = (scratch_ / "missing-python").string();
    EXPECT_THROW(Run("def main():\n    return 1\n"), sandbox::SandboxUnavailable);  // NOLINT
    EXPECT_TRUE(test_support::IsEmptyDirectory(scratch_));
}

// NOLINTNEXTLINE
TEST(NsjailBackend, BuildsJailCommandLine) {
    config::SandboxConfig config;
    config.nsjail_path = "/bin/sh";
    config.profile_path = "/dev/null";
    config.python_path = "/usr/bin/python3";
    const sandbox::NsjailBackend backend(config);
    const auto command = backend.Prepare(sandbox::RunLayout{"/scratch/run-1/driver", "/scratch/run-1/work"},
                                         std::chrono::milliseconds(10000));
    EXPECT_EQ(command.executable, "/bin/sh");
    const auto& args = command.args;
    EXPECT_THAT(args, ::testing::Contains("--pass_fd"));
    EXPECT_THAT(args, ::testing::Contains("/scratch/run-1/driver:/sandbox/driver"));
    EXPECT_THAT(args, ::testing::Contains("/scratch/run-1/work:/sandbox/work"));
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[args.size() - 4], "/usr/bin/python3");
    EXPECT_EQ(args.back(), "/sandbox/driver/driver.py");

    EXPECT_EQ(backend.DetectInfraFailure(255, "[E][2024-05-01T10:00:00+0000] mount failed\n"),
              "nsjail failed: [E][2024-05-01T10:00:00+0000] mount failed");
    EXPECT_EQ(backend.DetectInfraFailure(255, "Traceback\n"), "");
    EXPECT_EQ(backend.DetectInfraFailure(1, "[E] anything\n"), "");
}

// NOLINTNEXTLINE
TEST(NsjailBackend, UnreadableProfile) {
    config::SandboxConfig config;
    config.nsjail_path = "/bin/sh";
    config.profile_path = "/nonexistent/nsjail.cfg";
    const sandbox::NsjailBackend backend(config);
    EXPECT_THROW(backend.Prepare(sandbox::RunLayout{"/a", "/b"}, std::chrono::milliseconds(1000)),  // NOLINT
                 sandbox::SandboxUnavailable);
}

}  // namespace
