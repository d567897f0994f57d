#include "sandbox/sandbox_executor.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <memory>
#include <thread>
#include <vector>

#include "sandbox/driver.hpp"
#include "sandbox/scratch_directory.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace bp = boost::process;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
// How long to keep draining the pipes after the process group is gone.
constexpr auto kDrainGrace = std::chrono::milliseconds(500);
constexpr const char* kResultFileName = "result.json";
constexpr int kMaxInheritableFd = 65536;

std::string ErrnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            throw SandboxUnavailable(ErrnoMessage("pipe2"));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadFd() const { return fds_[0]; }
    int WriteFd() const { return fds_[1]; }

    void CloseRead() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void CloseWrite() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int Get() const { return fd_; }

private:
    int fd_ = -1;
};

// Keeps the first `limit` bytes read from a pipe and discards the rest, so a
// script printing without end cannot grow our memory.
class BoundedCapture {
public:
    BoundedCapture(int fd, std::size_t limit) : fd_(fd), limit_(limit) {}

    int Fd() const { return fd_; }
    bool IsOpen() const { return open_; }
    bool Truncated() const { return truncated_; }
    std::string Take() { return std::move(data_); }

    // Called when poll reports the fd ready, so read does not block.
    void ReadAvailable() {
        char buffer[64 * 1024];
        const auto count = ::read(fd_, buffer, sizeof(buffer));
        if (count > 0) {
            const auto room = limit_ > data_.size() ? limit_ - data_.size() : 0;
            const auto keep = std::min(room, static_cast<std::size_t>(count));
            data_.append(buffer, keep);
            if (keep < static_cast<std::size_t>(count)) {
                truncated_ = true;
            }
        } else if (count == 0 || errno != EINTR) {
            open_ = false;
        }
    }

private:
    int fd_;
    std::size_t limit_;
    std::string data_;
    bool open_ = true;
    bool truncated_ = false;
};

void Pump(BoundedCapture& out, BoundedCapture& err, std::chrono::milliseconds wait) {
    pollfd fds[2];
    BoundedCapture* owners[2];
    nfds_t count = 0;
    for (auto* capture : {&out, &err}) {
        if (capture->IsOpen()) {
            fds[count] = pollfd{capture->Fd(), POLLIN, 0};
            owners[count] = capture;
            ++count;
        }
    }
    if (count == 0) {
        std::this_thread::sleep_for(wait);
        return;
    }
    const auto ready = ::poll(fds, count, static_cast<int>(wait.count()));
    if (ready < 0) {
        if (errno != EINTR) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", ErrnoMessage("poll"));
            std::this_thread::sleep_for(wait);
        }
        return;
    }
    for (nfds_t i = 0; i < count; ++i) {
        if (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) {
            owners[i]->ReadAvailable();
        }
    }
}

// In the forked child: fd `from` becomes `to` and survives exec.
void MoveFd(int from, int to) {
    if (from == to) {
        ::fcntl(to, F_SETFD, 0);
    } else {
        ::dup2(from, to);
    }
}

bp::environment BuildEnvironment(const std::vector<std::string>& entries) {
    bp::environment env;
    for (const auto& entry : entries) {
        const auto split = entry.find('=');
        if (split == std::string::npos || split == 0) {
            continue;
        }
        env[entry.substr(0, split)] = entry.substr(split + 1);
    }
    return env;
}

std::optional<std::string> ReadResultChannel(const std::filesystem::path& path, std::size_t limit, bool* overflow) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::string data(limit + 1, '\0');
    input.read(&data[0], static_cast<std::streamsize>(data.size()));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (data.size() > limit) {
        *overflow = true;
        return std::nullopt;
    }
    if (data.empty()) {
        return std::nullopt;
    }
    return data;
}

}  // namespace

SandboxExecutor::SandboxExecutor(const config::ServiceConfig& config, const SandboxBackend& backend)
    : config_(config),
      backend_(backend),
      timeout_(config.execution.timeout_ms) {}

SandboxRun SandboxExecutor::Run(const std::string& script) const {
    SandboxRun run{};

    ScratchDirectory scratch(config_.sandbox.scratch_root);
    scratch.WriteFile(std::filesystem::path("driver") / kScriptFileName, script);
    scratch.WriteFile(std::filesystem::path("driver") / kDriverFileName, DriverSource());
    const auto command = backend_.Prepare(RunLayout{scratch.DriverDir(), scratch.WorkDir()}, timeout_);

    const auto result_path = scratch.Root() / kResultFileName;
    FileDescriptor result_fd(::open(result_path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (result_fd.Get() < 0) {
        throw SandboxUnavailable(ErrnoMessage("open result channel"));
    }
    Pipe out_pipe;
    Pipe err_pipe;

    const int out_fd = out_pipe.WriteFd();
    const int err_fd = err_pipe.WriteFd();
    const int channel_fd = result_fd.Get();
    const long open_max = ::sysconf(_SC_OPEN_MAX);
    const int max_fd = open_max > 0 ? static_cast<int>(std::min<long>(open_max, kMaxInheritableFd)) : 1024;
    const SandboxBackend& backend = backend_;

    bp::group group;
    std::unique_ptr<bp::child> child;
    const auto started = std::chrono::steady_clock::now();
    try {
        child = std::make_unique<bp::child>(
            bp::exe = command.executable,
            bp::args = command.args,
            bp::start_dir = command.working_dir,
            BuildEnvironment(command.environment),
            bp::std_in < bp::null,
            group,
            bp::extend::on_exec_setup = [out_fd, err_fd, channel_fd, max_fd, &backend](auto&) {
                MoveFd(out_fd, STDOUT_FILENO);
                MoveFd(err_fd, STDERR_FILENO);
                MoveFd(channel_fd, kResultChannelFd);
                for (int fd = kResultChannelFd + 1; fd < max_fd; ++fd) {
                    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
                }
                backend.ApplyChildLimits();
            });
    } catch (const bp::process_error& ex) {
        throw SandboxUnavailable(std::string("failed to start ") + backend_.Name() + " sandbox: " + ex.what());
    }
    out_pipe.CloseWrite();
    err_pipe.CloseWrite();

    BoundedCapture out(out_pipe.ReadFd(), config_.execution.max_output_bytes);
    BoundedCapture err(err_pipe.ReadFd(), config_.execution.max_output_bytes);

    const auto deadline = started + timeout_;
    bool exited = false;
    while (true) {
        std::error_code ec;
        if (!child->running(ec)) {
            if (ec) {
                utils::Log(utils::LogLevel::kWarn, "sandbox", "waitpid failed: " + ec.message());
            }
            exited = true;
            break;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        Pump(out, err, std::max(std::chrono::milliseconds(1), std::min(kPollInterval, remaining)));
    }
    run.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    run.timed_out = !exited;

    // Kill the whole group: the timed-out tree, or anything the script left
    // running in the background after a normal exit.
    std::error_code kill_ec;
    if (group.valid()) {
        group.terminate(kill_ec);
        if (kill_ec && kill_ec.value() != ESRCH) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "killpg failed: " + kill_ec.message());
        }
    }
    if (!exited) {
        std::error_code wait_ec;
        child->wait(wait_ec);
        if (wait_ec) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "wait after kill failed: " + wait_ec.message());
        }
    }

    // Writers are gone now unless a process escaped the group; cap the wait.
    const auto drain_deadline = std::chrono::steady_clock::now() + kDrainGrace;
    while ((out.IsOpen() || err.IsOpen()) && std::chrono::steady_clock::now() < drain_deadline) {
        Pump(out, err, kPollInterval);
    }
    if (out.IsOpen() || err.IsOpen()) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "output pipe still open after the process group was killed");
    }

    const int status = child->native_exit_code();
    if (WIFEXITED(status)) {
        run.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        run.signal = WTERMSIG(status);
        run.exit_code = 128 + run.signal;
    }

    run.output_truncated = out.Truncated();
    run.error_truncated = err.Truncated();
    run.output = out.Take();
    run.error = err.Take();

    if (!run.timed_out) {
        const auto infra_failure = backend_.DetectInfraFailure(run.exit_code, run.error);
        if (!infra_failure.empty()) {
            throw SandboxUnavailable(infra_failure);
        }
        run.result_channel = ReadResultChannel(result_path, config_.execution.max_result_bytes,
                                               &run.result_overflow);
    }

    utils::Log(utils::LogLevel::kDebug, "sandbox",
               "backend=" + backend_.Name() + " exit=" + std::to_string(run.exit_code) +
               " timed_out=" + (run.timed_out ? std::string("true") : std::string("false")) +
               " elapsed_ms=" + std::to_string(run.elapsed.count()) +
               " stdout_bytes=" + std::to_string(run.output.size()) +
               " stderr_bytes=" + std::to_string(run.error.size()));
    return run;
}

}  // namespace scriptbox::sandbox
