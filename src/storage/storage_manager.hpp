#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "storage/storage.hpp"

namespace pysandbox::storage {

// Front for the configured provider. With no provider every operation is a
// no-op and the manager reports itself healthy.
class StorageManager : public Storage {
public:
    StorageManager() = default;
    explicit StorageManager(std::unique_ptr<Storage> provider);

    // "disabled" when storage.enabled is false, otherwise storage.provider.
    // Throws ExecutionError for an unknown provider or bad provider settings.
    static std::shared_ptr<StorageManager> FromConfig(const config::StorageConfig& config);

    std::optional<std::string> Save(const std::string& content,
                                    const std::string& filename,
                                    const std::string& execution_id,
                                    const Metadata& metadata) override;
    std::string GenerateTemporaryUrl(const std::string& location, int ttl_s) override;
    bool HealthCheck() override;
    bool IsEnabled() const override { return provider_ != nullptr; }
    std::string Name() const override;

private:
    std::unique_ptr<Storage> provider_;
};

}  // namespace pysandbox::storage
