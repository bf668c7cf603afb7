#pragma once

#include <memory>

#include "config/config_schema.hpp"
#include "executors/executor_registry.hpp"
#include "storage/storage.hpp"

namespace pysandbox::executors {

// Registers "docker" and "firecracker". Creators copy the settings they need,
// so `config` does not have to outlive the registry.
void RegisterBuiltinExecutors(ExecutorRegistry& registry,
                              const config::Config& config,
                              std::shared_ptr<storage::Storage> storage);

}  // namespace pysandbox::executors
