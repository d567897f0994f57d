#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "execution/execution_service.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_backend.hpp"
#include "script/entry_point_validator.hpp"
#include "server/http_api.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

struct CommandLine {
    std::string command;
    std::string config_path;
    std::vector<std::string> positional;
};

bool ParseCommandLine(int argc, char** argv, CommandLine* out, std::string* error) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                *error = "--config needs a path";
                return false;
            }
            out->config_path = argv[++i];
        } else if (out->command.empty()) {
            out->command = arg;
        } else {
            out->positional.push_back(arg);
        }
    }
    if (out->command.empty()) {
        *error = "missing command";
        return false;
    }
    return true;
}

bool ReadFile(const std::string& path, std::string* content) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    *content = buffer.str();
    return true;
}

bool LoadServiceConfig(const CommandLine& cli, scriptbox::config::ServiceConfig* config) {
    *config = scriptbox::config::LoadConfig(cli.config_path);
    scriptbox::utils::ConfigureLogging(config->logging);
    const auto problems = scriptbox::config::ValidateConfig(*config);
    for (const auto& problem : problems) {
        std::cerr << "[config] " << problem << std::endl;
    }
    return problems.empty();
}

int RunServer(const CommandLine& cli) {
    scriptbox::config::ServiceConfig config;
    if (!LoadServiceConfig(cli, &config)) {
        return 1;
    }

    std::unique_ptr<scriptbox::execution::ExecutionService> service;
    try {
        service = std::make_unique<scriptbox::execution::ExecutionService>(
            config,
            scriptbox::sandbox::CreateBackend(config.sandbox));
    } catch (const scriptbox::sandbox::SandboxUnavailable& ex) {
        std::cerr << "[server] " << ex.what() << std::endl;
        return 1;
    }

    httplib::Server http_server;
    const auto worker_threads = static_cast<std::size_t>(config.server.worker_threads);
    http_server.new_task_queue = [worker_threads] {
        return new httplib::ThreadPool(worker_threads);
    };
    http_server.set_payload_max_length(config.server.max_request_bytes);
    scriptbox::server::RegisterRoutes(http_server, *service);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    const std::string host = config.server.host;
    const int port = config.server.port;
    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed, host, port]() {
        if (!http_server.listen(host, port)) {
            std::cerr << "[server] failed to listen on " << host << ":" << port << std::endl;
            listen_failed = true;
        }
    });

    scriptbox::utils::Log(scriptbox::utils::LogLevel::kInfo, "server",
                          "listening on " + host + ":" + std::to_string(port) +
                          " backend=" + service->Backend().Name() +
                          " timeout_ms=" + std::to_string(config.execution.timeout_ms));
    while (g_signal == 0 && !listen_failed) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    http_server.stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    scriptbox::utils::Log(scriptbox::utils::LogLevel::kInfo, "server", "stopped");
    return listen_failed ? 1 : 0;
}

int RunScriptFile(const CommandLine& cli) {
    if (cli.positional.empty()) {
        std::cerr << "Usage: scriptbox run FILE [--config PATH]" << std::endl;
        return 2;
    }
    scriptbox::config::ServiceConfig config;
    if (!LoadServiceConfig(cli, &config)) {
        return 2;
    }
    std::string script;
    if (!ReadFile(cli.positional.front(), &script)) {
        std::cerr << "Cannot read " << cli.positional.front() << std::endl;
        return 2;
    }

    try {
        const scriptbox::execution::ExecutionService service(
            config,
            scriptbox::sandbox::CreateBackend(config.sandbox));
        const auto result = service.Execute(scriptbox::execution::ExecutionRequest{script});
        std::cout << scriptbox::server::ResultToJson(result).dump(
                         2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return scriptbox::execution::IsSuccess(result) ? 0 : 1;
    } catch (const scriptbox::sandbox::SandboxUnavailable& ex) {
        std::cerr << "[sandbox] " << ex.what() << std::endl;
        return 2;
    } catch (const scriptbox::execution::ServiceBusy& ex) {
        std::cerr << "[exec] " << ex.what() << std::endl;
        return 2;
    }
}

int CheckScriptFile(const CommandLine& cli) {
    if (cli.positional.empty()) {
        std::cerr << "Usage: scriptbox check FILE" << std::endl;
        return 2;
    }
    std::string script;
    if (!ReadFile(cli.positional.front(), &script)) {
        std::cerr << "Cannot read " << cli.positional.front() << std::endl;
        return 2;
    }
    try {
        const auto outcome = scriptbox::script::ValidateEntryPoint(script);
        std::cout << "main(): " << (outcome.has_entry_point ? "found" : "missing") << std::endl;
        if (!outcome.other_functions.empty()) {
            std::cout << "other functions: " << scriptbox::utils::Join(outcome.other_functions, ", ")
                      << std::endl;
        }
        return outcome.has_entry_point ? 0 : 1;
    } catch (const scriptbox::script::SyntaxError& ex) {
        std::cout << "SyntaxError: " << ex.what() << std::endl;
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv) {
    CommandLine cli;
    std::string error;
    if (!ParseCommandLine(argc, argv, &cli, &error)) {
        std::cerr << error << std::endl;
        std::cout << "Usage: scriptbox serve [--config PATH] | scriptbox run FILE [--config PATH] | "
                     "scriptbox check FILE"
                  << std::endl;
        return 1;
    }

    if (cli.command == "serve") {
        return RunServer(cli);
    }
    if (cli.command == "run") {
        return RunScriptFile(cli);
    }
    if (cli.command == "check") {
        return CheckScriptFile(cli);
    }

    std::cout << "Unknown command: " << cli.command << std::endl;
    return 1;
}
