#pragma once

#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace httplib {
class Client;
}

namespace pysandbox::executors::firecracker {

// Firecracker's REST control API on the per-VM API socket.
class ApiClient {
public:
    explicit ApiClient(std::string socket_path,
                       std::chrono::seconds timeout = std::chrono::seconds(5));
    ~ApiClient();

    void SetBootSource(const std::string& kernel_path, const std::string& boot_args);
    void SetRootDrive(const std::string& rootfs_path);
    void SetMachineConfig(int vcpu_count, int mem_size_mib);
    void SetVsock(int guest_cid, const std::string& uds_path);
    void StartInstance();

    // The full pre-boot sequence in the order Firecracker requires.
    void Configure(const config::FirecrackerConfig& config, const std::string& vsock_path);

private:
    void Put(const std::string& path,
             const nlohmann::json& body,
             std::initializer_list<int> expected,
             const char* what);

    std::string socket_path_;
    std::unique_ptr<httplib::Client> client_;
};

}  // namespace pysandbox::executors::firecracker
