#include "executors/builtin_executors.hpp"

#include "executors/docker/docker_executor.hpp"
#include "executors/firecracker/firecracker_executor.hpp"

namespace pysandbox::executors {

void RegisterBuiltinExecutors(ExecutorRegistry& registry,
                              const config::Config& config,
                              std::shared_ptr<storage::Storage> storage) {
    registry.Register("docker", [settings = config.docker, limits = config.limits, storage]() {
        return std::unique_ptr<Executor>(
            std::make_unique<docker::DockerExecutor>(settings, limits, storage));
    });
    registry.Register("firecracker", [settings = config.firecracker, limits = config.limits, storage]() {
        return std::unique_ptr<Executor>(
            std::make_unique<firecracker::FirecrackerExecutor>(settings, limits, storage));
    });
}

}  // namespace pysandbox::executors
