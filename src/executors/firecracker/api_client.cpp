#include "executors/firecracker/api_client.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <utility>

#include "core/errors.hpp"
#include "httplib.h"

namespace pysandbox::executors::firecracker {

ApiClient::ApiClient(std::string socket_path, std::chrono::seconds timeout)
    : socket_path_(std::move(socket_path))
    , client_(std::make_unique<httplib::Client>(socket_path_)) {
    client_->set_address_family(AF_UNIX);
    client_->set_connection_timeout(static_cast<time_t>(timeout.count()), 0);
    client_->set_read_timeout(static_cast<time_t>(timeout.count()), 0);
    client_->set_write_timeout(static_cast<time_t>(timeout.count()), 0);
    client_->set_default_headers({{"Host", "localhost"}, {"Accept", "application/json"}});
}

ApiClient::~ApiClient() = default;

void ApiClient::Put(const std::string& path,
                    const nlohmann::json& body,
                    std::initializer_list<int> expected,
                    const char* what) {
    auto response = client_->Put(path, body.dump(), "application/json");
    if (!response) {
        throw core::ExecutionError(std::string(what) + ": " + httplib::to_string(response.error()));
    }
    if (std::find(expected.begin(), expected.end(), response->status) == expected.end()) {
        throw core::ExecutionError(std::string(what) + ": " + response->body);
    }
}

void ApiClient::SetBootSource(const std::string& kernel_path, const std::string& boot_args) {
    Put("/boot-source",
        {{"kernel_image_path", kernel_path}, {"boot_args", boot_args}},
        {204}, "Failed to set boot source");
}

void ApiClient::SetRootDrive(const std::string& rootfs_path) {
    Put("/drives/rootfs",
        {
            {"drive_id", "rootfs"},
            {"path_on_host", rootfs_path},
            {"is_root_device", true},
            {"is_read_only", false}
        },
        {204}, "Failed to set drive");
}

void ApiClient::SetMachineConfig(int vcpu_count, int mem_size_mib) {
    Put("/machine-config",
        {{"vcpu_count", vcpu_count}, {"mem_size_mib", mem_size_mib}},
        {204}, "Failed to set machine config");
}

void ApiClient::SetVsock(int guest_cid, const std::string& uds_path) {
    Put("/vsock",
        {{"guest_cid", guest_cid}, {"uds_path", uds_path}},
        {201, 204}, "Failed to set vsock");
}

void ApiClient::StartInstance() {
    Put("/actions", {{"action_type", "InstanceStart"}}, {204}, "Failed to start VM");
}

void ApiClient::Configure(const config::FirecrackerConfig& config, const std::string& vsock_path) {
    SetBootSource(config.kernel_path, config.boot_args);
    SetRootDrive(config.rootfs_path);
    SetMachineConfig(config.vcpu_count, config.memory_mb);
    SetVsock(config.guest_cid, vsock_path);
}

}  // namespace pysandbox::executors::firecracker
