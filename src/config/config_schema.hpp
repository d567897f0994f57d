#pragma once

#include <cstddef>
#include <string>

#include "utils/logging.hpp"

namespace scriptbox::config {

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8080;
    int worker_threads = 8;
    std::size_t max_request_bytes = 1024 * 1024;
};

struct ExecutionConfig {
    int timeout_ms = 10000;
    std::size_t max_output_bytes = 1024 * 1024;
    std::size_t max_result_bytes = 1024 * 1024;
    // 0 disables admission control.
    int max_concurrent_runs = 0;
    int admission_wait_ms = 0;
};

struct SandboxConfig {
    std::string backend = "nsjail";
    std::string nsjail_path = "nsjail";
    std::string profile_path = "/etc/scriptbox/nsjail.cfg";
    // Resolved on the host for the rlimit backend, inside the jail for nsjail.
    std::string python_path;
    std::string scratch_root;
    int memory_limit_mb = 512;
    int cpu_limit_s = 10;
    int max_processes = 32;
    int max_file_size_mb = 16;
};

struct ServiceConfig {
    ServerConfig server;
    ExecutionConfig execution;
    SandboxConfig sandbox;
    utils::LogConfig logging;
};

}  // namespace scriptbox::config
