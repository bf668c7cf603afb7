#pragma once

#include <sys/types.h>

#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "config/config_schema.hpp"
#include "executors/executor.hpp"
#include "storage/storage.hpp"

namespace pysandbox::executors::firecracker {

inline constexpr const char* kKvmDevice = "/dev/kvm";

// Every request boots its own microVM; see VmSession.
class FirecrackerExecutor : public Executor {
public:
    // Throws ExecutionError when the binary, kernel, rootfs or KVM is missing.
    FirecrackerExecutor(const config::FirecrackerConfig& config,
                        const config::LimitsConfig& limits,
                        std::shared_ptr<storage::Storage> storage);

    core::ExecutionResult Execute(const std::string& code, int timeout_s) override;
    bool HealthCheck() override;
    // Kills only hypervisors this executor started and clears stale sockets.
    void Cleanup() override;
    std::string Name() const override { return "firecracker"; }

    std::set<pid_t> LivePids() const;

private:
    config::FirecrackerConfig config_;
    config::LimitsConfig limits_;
    std::shared_ptr<storage::Storage> storage_;

    mutable std::mutex mutex_;
    std::set<pid_t> pids_;
};

}  // namespace pysandbox::executors::firecracker
