#include "service/execution_service.hpp"

#include <utility>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::service {

ExecutionService::ExecutionService(const config::Config& config,
                                   executors::ExecutorFactory& factory,
                                   std::shared_ptr<storage::Storage> storage)
    : server_(config.server)
    , limits_(config.limits)
    , validator_(config.validator)
    , factory_(factory)
    , storage_(std::move(storage)) {}

void ExecutionService::CheckRequest(const core::ExecutionRequest& request) const {
    if (utils::Trim(request.code).empty()) {
        throw core::ValidationError("Code cannot be empty", {"Code cannot be empty"});
    }
    if (request.timeout < limits_.min_timeout_s || request.timeout > limits_.max_timeout_s) {
        const auto message = "Timeout must be between " + std::to_string(limits_.min_timeout_s) +
                             " and " + std::to_string(limits_.max_timeout_s) + " seconds";
        throw core::ValidationError(message, {message});
    }
}

core::ValidationResult ExecutionService::Validate(const std::string& code) const {
    return validator_.Validate(code);
}

core::ExecutionResult ExecutionService::Execute(const core::ExecutionRequest& request) {
    CheckRequest(request);

    const auto validation = validator_.Validate(request.code);
    for (const auto& warning : validation.warnings) {
        utils::Log(utils::LogLevel::kInfo, "service") << warning;
    }
    if (!validation.ok) {
        utils::Log(utils::LogLevel::kInfo, "service")
            << "rejected submission with " << validation.errors.size() << " error(s)";
        throw core::ValidationError("Validation failed: " + utils::Join(validation.errors, "; "),
                                    validation.errors);
    }

    auto executor = factory_.GetHealthy();
    auto result = executor->Execute(request.code, request.timeout);
    utils::Log(utils::LogLevel::kInfo, "service")
        << "executed on " << executor->Name() << " success=" << (result.success ? "true" : "false")
        << " exit_code=" << result.exit_code << " time=" << result.execution_time << "s"
        << " files=" << result.files.size();
    return result;
}

nlohmann::json ExecutionService::Health() {
    bool executor_healthy = false;
    std::string executor_name = "unknown";
    try {
        auto executor = factory_.GetHealthy();
        executor_healthy = true;
        executor_name = executor->Name();
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kWarn, "service") << "health check: executor unavailable - " << e.what();
    }

    nlohmann::json backends = nlohmann::json::object();
    for (const auto& [provider, healthy] : factory_.CheckActive()) {
        backends[provider] = healthy;
    }

    bool storage_enabled = false;
    bool storage_healthy = true;
    if (storage_) {
        storage_enabled = storage_->IsEnabled();
        try {
            storage_healthy = storage_->HealthCheck();
        } catch (const std::exception& e) {
            utils::Log(utils::LogLevel::kWarn, "service") << "storage health check failed: " << e.what();
            storage_healthy = false;
        }
    }

    return {
        {"status", executor_healthy ? "healthy" : "degraded"},
        {"version", server_.version},
        {"executor", {
            {"provider", factory_.PrimaryProvider()},
            {"name", executor_name},
            {"healthy", executor_healthy},
            {"fallbacks", factory_.FallbackProviders()},
            {"available_providers", factory_.AvailableProviders()},
            {"active_providers", factory_.ActiveProviders()},
            {"backends", backends}
        }},
        {"storage", {
            {"enabled", storage_enabled},
            {"healthy", storage_healthy}
        }}
    };
}

}  // namespace pysandbox::service
