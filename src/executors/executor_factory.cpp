#include "executors/executor_factory.hpp"

#include <algorithm>
#include <utility>

#include "core/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executors {

ExecutorFactory::ExecutorFactory(const ExecutorRegistry& registry,
                                 const config::ExecutorConfig& config)
    : registry_(registry)
    , primary_(utils::Trim(config.provider))
    , fallbacks_(utils::SplitCsv(config.fallback_providers)) {}

std::shared_ptr<Executor> ExecutorFactory::Create(const std::optional<std::string>& name) {
    const std::string provider = name ? *name : primary_;

    // Construction happens under the lock so concurrent first use builds one instance.
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cached = instances_.find(provider);
    if (cached != instances_.end()) {
        return cached->second;
    }

    const auto& creator = registry_.Get(provider);
    std::unique_ptr<Executor> executor;
    try {
        executor = creator();
    } catch (const std::exception& e) {
        throw core::ExecutionError("Failed to initialize executor '" + provider + "': " + e.what());
    }
    if (!executor) {
        throw core::ExecutionError("Failed to initialize executor '" + provider +
                                   "': constructor returned no instance");
    }

    std::shared_ptr<Executor> instance(std::move(executor));
    instances_.emplace(provider, instance);
    utils::Log(utils::LogLevel::kInfo, "factory")
        << "executor initialized: " << instance->Name() << " (provider: " << provider << ")";
    return instance;
}

std::shared_ptr<Executor> ExecutorFactory::GetHealthy() {
    std::vector<std::string> tried;

    auto attempt = [&](const std::string& provider, const char* role) -> std::shared_ptr<Executor> {
        tried.push_back(provider);
        try {
            auto executor = Create(provider);
            if (executor->HealthCheck()) {
                return executor;
            }
            utils::Log(utils::LogLevel::kWarn, "factory")
                << role << " executor (" << provider << ") health check failed";
        } catch (const std::exception& e) {
            utils::Log(utils::LogLevel::kWarn, "factory")
                << role << " executor (" << provider << ") unavailable: " << e.what();
        }
        return nullptr;
    };

    if (auto executor = attempt(primary_, "primary")) {
        return executor;
    }

    for (const auto& provider : fallbacks_) {
        if (std::find(tried.begin(), tried.end(), provider) != tried.end()) {
            continue;
        }
        if (!registry_.Has(provider)) {
            utils::Log(utils::LogLevel::kWarn, "factory")
                << "fallback provider '" << provider << "' not registered, skipping";
            continue;
        }
        if (auto executor = attempt(provider, "fallback")) {
            utils::Log(utils::LogLevel::kInfo, "factory") << "using fallback executor: " << provider;
            return executor;
        }
    }

    const auto registered = registry_.List();
    throw core::InfrastructureError("No healthy executor available. Tried: " +
                                        utils::Join(tried, ", ") +
                                        ". Registered providers: " + utils::Join(registered, ", "),
                                    tried, registered);
}

void ExecutorFactory::CleanupAll() {
    std::map<std::string, std::shared_ptr<Executor>> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances.swap(instances_);
    }
    for (const auto& [provider, executor] : instances) {
        try {
            executor->Cleanup();
            utils::Log(utils::LogLevel::kInfo, "factory") << "cleaned up executor: " << provider;
        } catch (const std::exception& e) {
            utils::Log(utils::LogLevel::kWarn, "factory")
                << "cleanup failed for executor " << provider << ": " << e.what();
        }
    }
}

std::vector<std::string> ExecutorFactory::ActiveProviders() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [provider, _] : instances_) {
        names.push_back(provider);
    }
    return names;
}

std::map<std::string, bool> ExecutorFactory::CheckActive() {
    std::map<std::string, std::shared_ptr<Executor>> instances;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        instances = instances_;
    }
    std::map<std::string, bool> health;
    for (const auto& [provider, executor] : instances) {
        try {
            health[provider] = executor->HealthCheck();
        } catch (const std::exception& e) {
            utils::Log(utils::LogLevel::kWarn, "factory")
                << "health check of " << provider << " threw: " << e.what();
            health[provider] = false;
        }
    }
    return health;
}

}  // namespace pysandbox::executors
