#include "storage/storage_manager.hpp"

#include <utility>

#include "core/errors.hpp"
#include "storage/r2_storage.hpp"
#include "utils/logging.hpp"

namespace pysandbox::storage {

StorageManager::StorageManager(std::unique_ptr<Storage> provider)
    : provider_(std::move(provider)) {}

std::shared_ptr<StorageManager> StorageManager::FromConfig(const config::StorageConfig& config) {
    if (!config.enabled || config.provider == "disabled") {
        utils::Log(utils::LogLevel::kInfo, "storage") << "disabled";
        return std::make_shared<StorageManager>();
    }
    if (config.provider == "r2") {
        auto manager = std::make_shared<StorageManager>(std::make_unique<R2Storage>(config.r2));
        utils::Log(utils::LogLevel::kInfo, "storage")
            << "provider=r2 bucket=" << config.r2.bucket;
        return manager;
    }
    throw core::ExecutionError("Unknown storage provider: " + config.provider);
}

std::optional<std::string> StorageManager::Save(const std::string& content,
                                                const std::string& filename,
                                                const std::string& execution_id,
                                                const Metadata& metadata) {
    if (!provider_) {
        return std::nullopt;
    }
    return provider_->Save(content, filename, execution_id, metadata);
}

std::string StorageManager::GenerateTemporaryUrl(const std::string& location, int ttl_s) {
    if (!provider_) {
        throw core::ExecutionError("Storage is disabled");
    }
    return provider_->GenerateTemporaryUrl(location, ttl_s);
}

bool StorageManager::HealthCheck() {
    return provider_ ? provider_->HealthCheck() : true;
}

std::string StorageManager::Name() const {
    return provider_ ? provider_->Name() : "disabled";
}

}  // namespace pysandbox::storage
