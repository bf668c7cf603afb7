#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "core/types.hpp"
#include "executors/executor_factory.hpp"
#include "nlohmann/json.hpp"
#include "storage/storage.hpp"
#include "validator/code_validator.hpp"

namespace pysandbox::service {

// Single entry point for running a submission: request checks, static
// validation, then the first healthy backend.
class ExecutionService {
public:
    ExecutionService(const config::Config& config,
                     executors::ExecutorFactory& factory,
                     std::shared_ptr<storage::Storage> storage);

    // Throws ValidationError before any backend runs, InfrastructureError when
    // no backend is available. A failed run is returned, not thrown.
    core::ExecutionResult Execute(const core::ExecutionRequest& request);

    core::ValidationResult Validate(const std::string& code) const;

    // {status, version, executor{...}, storage{...}}
    nlohmann::json Health();

    int DefaultTimeout() const { return limits_.default_timeout_s; }

private:
    void CheckRequest(const core::ExecutionRequest& request) const;

    config::ServerConfig server_;
    config::LimitsConfig limits_;
    validator::CodeValidator validator_;
    executors::ExecutorFactory& factory_;
    std::shared_ptr<storage::Storage> storage_;
};

}  // namespace pysandbox::service
