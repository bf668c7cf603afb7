#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "executors/executor.hpp"
#include "executors/executor_registry.hpp"

namespace pysandbox::executors {

// Builds and caches one executor per provider name and walks the fallback
// chain when the primary is unhealthy.
class ExecutorFactory {
public:
    ExecutorFactory(const ExecutorRegistry& registry, const config::ExecutorConfig& config);

    // Defaults to the configured primary provider. Throws NotFoundError for an
    // unregistered name and ExecutionError when construction fails.
    std::shared_ptr<Executor> Create(const std::optional<std::string>& name = std::nullopt);

    // Throws InfrastructureError when no provider is both constructible and healthy.
    std::shared_ptr<Executor> GetHealthy();

    void CleanupAll();

    const std::string& PrimaryProvider() const { return primary_; }
    const std::vector<std::string>& FallbackProviders() const { return fallbacks_; }
    std::vector<std::string> AvailableProviders() const { return registry_.List(); }
    std::vector<std::string> ActiveProviders() const;
    // Health of every instance built so far, keyed by provider name.
    std::map<std::string, bool> CheckActive();

private:
    const ExecutorRegistry& registry_;
    std::string primary_;
    std::vector<std::string> fallbacks_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Executor>> instances_;
};

}  // namespace pysandbox::executors
