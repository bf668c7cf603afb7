#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "executors/artifacts.hpp"
#include "executors/docker/docker_client.hpp"
#include "executors/executor.hpp"
#include "storage/storage.hpp"

namespace pysandbox::executors::docker {

// "128m" -> 134217728. Suffixes b, k, m, g (1024-based), case-insensitive.
// Throws std::invalid_argument.
std::int64_t ParseMemorySize(const std::string& value);

// Body of POST /containers/create for one run of `code`.
nlohmann::json BuildContainerSpec(const config::DockerConfig& config, const std::string& code);

// Walks a tar stream, offering every regular file to the collector.
void CollectFromTar(const std::string& tar, ArtifactCollector& collector);

// One network-less, capability-less container per request.
class DockerExecutor : public Executor {
public:
    // Throws ExecutionError when the engine is unreachable or the image is missing.
    DockerExecutor(const config::DockerConfig& docker,
                   const config::LimitsConfig& limits,
                   std::shared_ptr<storage::Storage> storage);

    core::ExecutionResult Execute(const std::string& code, int timeout_s) override;
    bool HealthCheck() override;
    void Cleanup() override;
    std::string Name() const override { return "docker"; }

private:
    std::vector<std::string> ExtractFiles(const std::string& container_id,
                                          const std::string& execution_id);
    void RemoveQuietly(const std::string& container_id);

    config::DockerConfig docker_;
    config::LimitsConfig limits_;
    std::shared_ptr<storage::Storage> storage_;
    std::unique_ptr<DockerClient> client_;
};

}  // namespace pysandbox::executors::docker
