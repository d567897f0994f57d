#include "sandbox/scratch_directory.hpp"

#include <fstream>
#include <iomanip>
#include <random>
#include <sstream>

#include "sandbox/sandbox_backend.hpp"
#include "utils/logging.hpp"

namespace scriptbox::sandbox {
namespace {

std::string RandomSuffix() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(16) << engine();
    return oss.str();
}

}  // namespace

ScratchDirectory::ScratchDirectory(const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec) {
        throw SandboxUnavailable("cannot create scratch root " + root.string() + ": " + ec.message());
    }
    // create_directory reports false for an existing path, so a collision
    // just draws another name.
    for (int attempt = 0; attempt < 8 && root_.empty(); ++attempt) {
        auto candidate = root / ("run-" + RandomSuffix());
        if (std::filesystem::create_directory(candidate, ec)) {
            root_ = std::move(candidate);
        } else if (ec) {
            throw SandboxUnavailable("cannot create scratch directory: " + ec.message());
        }
    }
    if (root_.empty()) {
        throw SandboxUnavailable("cannot allocate a unique scratch directory under " + root.string());
    }
    std::filesystem::permissions(root_, std::filesystem::perms::owner_all, ec);
    if (!ec) {
        std::filesystem::create_directory(DriverDir(), ec);
    }
    if (!ec) {
        std::filesystem::create_directory(WorkDir(), ec);
    }
    if (ec) {
        const auto message = ec.message();
        std::filesystem::remove_all(root_, ec);
        throw SandboxUnavailable("cannot prepare scratch directory: " + message);
    }
}

ScratchDirectory::~ScratchDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox",
                   "failed to remove " + root_.string() + ": " + ec.message());
    }
}

void ScratchDirectory::WriteFile(const std::filesystem::path& relative, const std::string& content) const {
    const auto path = root_ / relative;
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw SandboxUnavailable("cannot write " + path.string());
    }
    output << content;
    output.close();
    if (!output) {
        throw SandboxUnavailable("failed writing " + path.string());
    }
}

}  // namespace scriptbox::sandbox
