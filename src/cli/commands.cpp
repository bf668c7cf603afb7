#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "core/types.hpp"
#include "executors/builtin_executors.hpp"
#include "executors/executor_factory.hpp"
#include "executors/executor_registry.hpp"
#include "nlohmann/json.hpp"
#include "server/http_server.hpp"
#include "service/execution_service.hpp"
#include "storage/storage_manager.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "validator/code_validator.hpp"

namespace {

using pysandbox::utils::Log;
using pysandbox::utils::LogLevel;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

void PrintUsage() {
    std::cout << "Usage: pysandbox serve | pysandbox validate <file> | "
                 "pysandbox run <file> [timeout] | pysandbox providers"
              << std::endl;
}

bool ReadSource(const std::string& path, std::string& code) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        std::cerr << "cannot read " << path << std::endl;
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    code = buffer.str();
    return true;
}

// Everything a command needs, wired in dependency order.
struct Runtime {
    pysandbox::config::Config config;
    std::shared_ptr<pysandbox::storage::StorageManager> storage;
    pysandbox::executors::ExecutorRegistry registry;
    std::unique_ptr<pysandbox::executors::ExecutorFactory> factory;
    std::unique_ptr<pysandbox::service::ExecutionService> service;
};

std::unique_ptr<Runtime> BuildRuntime() {
    auto runtime = std::make_unique<Runtime>();
    runtime->config = pysandbox::config::LoadConfig();

    pysandbox::utils::LogConfig log_config{};
    log_config.min_level = pysandbox::utils::ParseLogLevel(runtime->config.logging.level);
    pysandbox::utils::ApplyLogConfig(log_config);

    try {
        runtime->storage = pysandbox::storage::StorageManager::FromConfig(runtime->config.storage);
        if (runtime->storage->IsEnabled()) {
            if (runtime->storage->HealthCheck()) {
                Log(LogLevel::kInfo, "storage") << "ready (provider: " << runtime->storage->Name() << ")";
            } else {
                Log(LogLevel::kWarn, "storage") << "provider " << runtime->storage->Name() << " is not healthy";
            }
        } else {
            Log(LogLevel::kInfo, "storage") << "disabled";
        }
    } catch (const std::exception& e) {
        Log(LogLevel::kWarn, "storage") << "failed to initialize, continuing without file storage: " << e.what();
        runtime->storage = std::make_shared<pysandbox::storage::StorageManager>();
    }

    pysandbox::executors::RegisterBuiltinExecutors(runtime->registry, runtime->config, runtime->storage);
    runtime->factory = std::make_unique<pysandbox::executors::ExecutorFactory>(
        runtime->registry, runtime->config.executor);
    runtime->service = std::make_unique<pysandbox::service::ExecutionService>(
        runtime->config, *runtime->factory, runtime->storage);
    return runtime;
}

int RunServe() {
    auto runtime = BuildRuntime();
    const auto& config = runtime->config;

    try {
        auto executor = runtime->factory->GetHealthy();
        Log(LogLevel::kInfo, "service") << "executor ready: " << executor->Name()
                                         << " (provider: " << config.executor.provider << ")";
        Log(LogLevel::kInfo, "service")
            << "available providers: " << pysandbox::utils::Join(runtime->registry.List(), ", ");
    } catch (const std::exception& e) {
        Log(LogLevel::kWarn, "service") << "no healthy executor available: " << e.what();
        Log(LogLevel::kWarn, "service") << "/execute will fail until an executor is available";
    }

    pysandbox::server::HttpServer http_server(config.server, *runtime->service);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    std::atomic<bool> listen_failed{false};
    std::thread http_thread([&http_server, &listen_failed]() {
        if (!http_server.Listen()) {
            listen_failed.store(true);
        }
    });

    while (g_signal == 0 && !listen_failed.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (listen_failed.load()) {
        Log(LogLevel::kError, "http") << "failed to listen on " << config.server.host << ":"
                                       << config.server.port;
    } else {
        Log(LogLevel::kInfo, "service") << config.server.app_name << " shutting down";
    }

    http_server.Stop();
    if (http_thread.joinable()) {
        http_thread.join();
    }
    runtime->factory->CleanupAll();
    Log(LogLevel::kInfo, "service") << "cleanup complete";
    return listen_failed.load() ? 1 : 0;
}

int RunValidate(const std::string& path) {
    std::string code;
    if (!ReadSource(path, code)) {
        return 1;
    }
    auto config = pysandbox::config::LoadConfig();
    pysandbox::validator::CodeValidator validator(config.validator);
    const auto result = validator.Validate(code);
    std::cout << pysandbox::core::DumpJson(pysandbox::core::ToJson(result), 2) << std::endl;
    return result.ok ? 0 : 1;
}

int RunOnce(const std::string& path, const std::string& timeout_arg) {
    std::string code;
    if (!ReadSource(path, code)) {
        return 1;
    }
    auto runtime = BuildRuntime();

    pysandbox::core::ExecutionRequest request{};
    request.code = code;
    request.timeout = runtime->config.limits.default_timeout_s;
    if (!timeout_arg.empty()) {
        try {
            request.timeout = std::stoi(timeout_arg);
        } catch (const std::exception&) {
            std::cerr << "invalid timeout: " << timeout_arg << std::endl;
            return 1;
        }
    }

    int status = 0;
    try {
        const auto result = runtime->service->Execute(request);
        std::cout << pysandbox::core::DumpJson(pysandbox::core::ToJson(result), 2) << std::endl;
        status = result.success ? 0 : 1;
    } catch (const pysandbox::core::ValidationError& e) {
        nlohmann::json body = {{"error", "Validation failed"}, {"message", e.what()}, {"errors", e.Errors()}};
        std::cout << pysandbox::core::DumpJson(body, 2) << std::endl;
        status = 2;
    } catch (const pysandbox::core::InfrastructureError& e) {
        nlohmann::json body = {{"error", "Execution failed"}, {"message", e.what()}, {"providers_tried", e.Tried()}};
        std::cout << pysandbox::core::DumpJson(body, 2) << std::endl;
        status = 3;
    }
    runtime->factory->CleanupAll();
    return status;
}

int ListProviders() {
    auto config = pysandbox::config::LoadConfig();
    auto storage = std::make_shared<pysandbox::storage::StorageManager>();
    pysandbox::executors::ExecutorRegistry registry;
    pysandbox::executors::RegisterBuiltinExecutors(registry, config, storage);
    for (const auto& name : registry.List()) {
        std::cout << name;
        if (name == pysandbox::utils::Trim(config.executor.provider)) {
            std::cout << " (primary)";
        }
        std::cout << std::endl;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return 1;
    }
    const std::string command = argv[1];

    try {
        if (command == "serve") {
            return RunServe();
        }
        if (command == "validate" && argc >= 3) {
            return RunValidate(argv[2]);
        }
        if (command == "run" && argc >= 3) {
            return RunOnce(argv[2], argc >= 4 ? argv[3] : "");
        }
        if (command == "providers") {
            return ListProviders();
        }
    } catch (const std::exception& e) {
        Log(LogLevel::kError, "service") << "fatal: " << e.what();
        return 1;
    }

    PrintUsage();
    return 1;
}
