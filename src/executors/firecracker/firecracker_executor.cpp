#include "executors/firecracker/firecracker_executor.hpp"

#include <signal.h>

#include <chrono>
#include <filesystem>
#include <utility>

#include "core/errors.hpp"
#include "executors/firecracker/vm_session.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executors::firecracker {
namespace {

sandbox::ProcessResult QueryVersion(const std::string& binary) {
    sandbox::ProcessOptions options{};
    options.argv = {binary, "--version"};
    options.timeout = std::chrono::seconds(5);
    options.grace = std::chrono::milliseconds(500);
    return sandbox::ProcessRunner::Run(options);
}

bool Exists(const std::string& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

}  // namespace

FirecrackerExecutor::FirecrackerExecutor(const config::FirecrackerConfig& config,
                                         const config::LimitsConfig& limits,
                                         std::shared_ptr<storage::Storage> storage)
    : config_(config)
    , limits_(limits)
    , storage_(std::move(storage)) {
    const auto version = QueryVersion(config_.binary);
    if (!version.launched) {
        throw core::ExecutionError("Firecracker binary not found (" + config_.binary +
                                   "). Install Firecracker and make sure it is on PATH");
    }
    if (version.timed_out) {
        throw core::ExecutionError("Firecracker binary timeout");
    }
    if (version.exit_code != 0) {
        throw core::ExecutionError("Firecracker binary not working properly");
    }
    if (!Exists(config_.kernel_path)) {
        throw core::ExecutionError("Firecracker kernel not found: " + config_.kernel_path);
    }
    if (!Exists(config_.rootfs_path)) {
        throw core::ExecutionError("Firecracker rootfs not found: " + config_.rootfs_path);
    }
    if (!Exists(kKvmDevice)) {
        throw core::ExecutionError(std::string(kKvmDevice) + " not found. Enable KVM on this host");
    }
    std::error_code ec;
    std::filesystem::create_directories(config_.socket_dir, ec);
    if (ec) {
        throw core::ExecutionError("Cannot create socket directory " + config_.socket_dir + ": " +
                                   ec.message());
    }

    utils::Log(utils::LogLevel::kInfo, "firecracker")
        << "ready version=" << utils::Trim(version.output) << " kernel=" << config_.kernel_path
        << " rootfs=" << config_.rootfs_path << " memory=" << config_.memory_mb
        << "MiB vcpus=" << config_.vcpu_count;
}

core::ExecutionResult FirecrackerExecutor::Execute(const std::string& code, int timeout_s) {
    ProcessHooks hooks{};
    hooks.started = [this](pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        pids_.insert(pid);
    };
    hooks.stopped = [this](pid_t pid) {
        std::lock_guard<std::mutex> lock(mutex_);
        pids_.erase(pid);
    };

    VmSession session(config_, limits_, storage_, std::move(hooks));
    utils::Log(utils::LogLevel::kInfo, "firecracker") << "starting vm " << session.Id();
    return session.Run(code, timeout_s);
}

bool FirecrackerExecutor::HealthCheck() {
    const auto version = QueryVersion(config_.binary);
    if (!version.launched || version.timed_out || version.exit_code != 0) {
        return false;
    }
    return Exists(config_.kernel_path) && Exists(config_.rootfs_path) && Exists(kKvmDevice);
}

std::set<pid_t> FirecrackerExecutor::LivePids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pids_;
}

void FirecrackerExecutor::Cleanup() {
    for (const auto pid : LivePids()) {
        if (::kill(pid, SIGKILL) != 0) {
            utils::Log(utils::LogLevel::kDebug, "firecracker") << "kill " << pid << " failed";
        }
    }

    std::size_t removed = 0;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(config_.socket_dir, ec), end; !ec && it != end;
         it.increment(ec)) {
        const auto extension = it->path().extension().string();
        if (extension != ".sock" && extension != ".vsock") {
            continue;
        }
        std::error_code remove_ec;
        if (std::filesystem::remove(it->path(), remove_ec)) {
            ++removed;
        }
    }
    utils::Log(utils::LogLevel::kInfo, "firecracker") << "cleaned up, removed " << removed << " socket files";
}

}  // namespace pysandbox::executors::firecracker
