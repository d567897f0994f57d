#pragma once

#include <unistd.h>

#include <boost/process/search_path.hpp>
#include <filesystem>
#include <string>

#include "config/config_schema.hpp"

namespace scriptbox::test_support {

// A real interpreter, not a version-manager shim that needs $HOME and PATH.
inline std::string FindPython() {
    for (const char* candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
        if (::access(candidate, X_OK) == 0) {
            return candidate;
        }
    }
    const auto found = boost::process::search_path("python3");
    return found.empty() ? std::string() : found.string();
}

inline std::filesystem::path MakeTempRoot(const std::string& name) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("scriptbox_test_" + name + "_" + std::to_string(::getpid()));
    std::filesystem::remove_all(root);
    std::filesystem::create_directories(root);
    return root;
}

inline config::ServiceConfig RlimitConfig(const std::string& python, const std::filesystem::path& scratch) {
    config::ServiceConfig config;
    config.sandbox.backend = "rlimit";
    config.sandbox.python_path = python;
    config.sandbox.scratch_root = scratch.string();
    // RLIMIT_NPROC counts every process of the user, not just the run.
    config.sandbox.max_processes = 0;
    config.execution.timeout_ms = 5000;
    config.logging.min_level = utils::LogLevel::kWarn;
    return config;
}

inline bool IsEmptyDirectory(const std::filesystem::path& path) {
    return std::filesystem::is_directory(path) && std::filesystem::is_empty(path);
}

}  // namespace scriptbox::test_support
