#pragma once

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "config/config_schema.hpp"
#include "core/types.hpp"
#include "storage/storage.hpp"
#include "vsock/channel.hpp"

namespace pysandbox::executors::firecracker {

// One request walks these states in order; any failure jumps to kTornDown.
enum class VmState {
    kCreated,
    kProcessStarted,
    kSocketReady,
    kConfigured,
    kBooted,
    kExecuting,
    kExtracting,
    kTornDown
};

const char* ToString(VmState state);

// Lets the owning executor follow which hypervisor processes are alive.
struct ProcessHooks {
    std::function<void(pid_t)> started;
    std::function<void(pid_t)> stopped;
};

// A single-use microVM: spawn, configure, boot, run one piece of code,
// optionally pull its output files, tear everything down.
class VmSession {
public:
    VmSession(const config::FirecrackerConfig& config,
              const config::LimitsConfig& limits,
              std::shared_ptr<storage::Storage> storage,
              ProcessHooks hooks = {},
              std::string vm_id = {});
    ~VmSession();

    VmSession(const VmSession&) = delete;
    VmSession& operator=(const VmSession&) = delete;

    // Never throws; failures come back as an unsuccessful result.
    core::ExecutionResult Run(const std::string& code, int timeout_s);

    VmState State() const { return state_; }
    const std::string& Id() const { return vm_id_; }
    const std::string& ApiSocketPath() const { return api_socket_; }
    const std::string& VsockPath() const { return vsock_path_; }

private:
    void Transition(VmState next);

    void StartProcess();
    void WaitForApiSocket();
    void Configure();
    void Boot();
    core::ExecutionResult ExecuteCode(const std::string& code, int timeout_s);
    void ConnectToAgent();
    std::vector<std::string> ExtractFiles();
    void Teardown();

    config::FirecrackerConfig config_;
    config::LimitsConfig limits_;
    std::shared_ptr<storage::Storage> storage_;
    ProcessHooks hooks_;
    std::string vm_id_;
    std::string api_socket_;
    std::string vsock_path_;
    std::string stderr_path_;
    VmState state_ = VmState::kCreated;

    struct Hypervisor;
    std::unique_ptr<Hypervisor> process_;
    pid_t pid_ = -1;
    boost::asio::io_context io_;
    std::unique_ptr<vsock::Channel> channel_;
};

}  // namespace pysandbox::executors::firecracker
