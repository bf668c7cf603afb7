#include <gtest/gtest.h>

#include <sys/socket.h>

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "executors/firecracker/api_client.hpp"
#include "httplib.h"
#include "utils/common.hpp"

namespace pysandbox::executors::firecracker {
namespace {

// Stands in for the hypervisor's API socket and records every PUT.
class FakeApiServer {
public:
    FakeApiServer()
        : path_((std::filesystem::temp_directory_path() / ("pysandbox_api_" + utils::NewId() + ".sock"))
                    .string()) {
        server_.set_address_family(AF_UNIX);
        server_.Put(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.emplace_back(req.path, nlohmann::json::parse(req.body));
            if (req.path == reject_path_) {
                res.status = 400;
                res.set_content(R"({"fault_message":"bad request"})", "application/json");
                return;
            }
            res.status = req.path == "/vsock" ? 201 : 204;
        });
        thread_ = std::thread([this]() { server_.listen(path_, 80); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~FakeApiServer() {
        server_.stop();
        thread_.join();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void Reject(const std::string& path) { reject_path_ = path; }

    std::vector<std::pair<std::string, nlohmann::json>> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    httplib::Server server_;
    std::thread thread_;
    std::mutex mutex_;
    std::string reject_path_;
    std::vector<std::pair<std::string, nlohmann::json>> requests_;
};

TEST(ApiClientTest, ConfiguresInRequiredOrder) {
    FakeApiServer server;
    ASSERT_TRUE(std::filesystem::exists(server.Path()));

    config::FirecrackerConfig config{};
    config.kernel_path = "/images/vmlinux";
    config.rootfs_path = "/images/rootfs.ext4";
    config.memory_mb = 256;
    config.vcpu_count = 2;

    ApiClient client(server.Path());
    client.Configure(config, "/tmp/firecracker/vm.vsock");
    client.StartInstance();

    const auto requests = server.Requests();
    ASSERT_EQ(requests.size(), 5u);
    EXPECT_EQ(requests[0].first, "/boot-source");
    EXPECT_EQ(requests[0].second["kernel_image_path"], "/images/vmlinux");
    EXPECT_EQ(requests[0].second["boot_args"], config.boot_args);

    EXPECT_EQ(requests[1].first, "/drives/rootfs");
    EXPECT_EQ(requests[1].second["drive_id"], "rootfs");
    EXPECT_EQ(requests[1].second["path_on_host"], "/images/rootfs.ext4");
    EXPECT_EQ(requests[1].second["is_root_device"], true);
    EXPECT_EQ(requests[1].second["is_read_only"], false);

    EXPECT_EQ(requests[2].first, "/machine-config");
    EXPECT_EQ(requests[2].second["vcpu_count"], 2);
    EXPECT_EQ(requests[2].second["mem_size_mib"], 256);

    EXPECT_EQ(requests[3].first, "/vsock");
    EXPECT_EQ(requests[3].second["guest_cid"], 3);
    EXPECT_EQ(requests[3].second["uds_path"], "/tmp/firecracker/vm.vsock");

    EXPECT_EQ(requests[4].first, "/actions");
    EXPECT_EQ(requests[4].second["action_type"], "InstanceStart");
}

TEST(ApiClientTest, UnexpectedStatusCarriesResponseBody) {
    FakeApiServer server;
    server.Reject("/machine-config");
    ApiClient client(server.Path());
    try {
        client.SetMachineConfig(1, 128);
        FAIL() << "expected ExecutionError";
    } catch (const core::ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()), R"(Failed to set machine config: {"fault_message":"bad request"})");
    }
}

TEST(ApiClientTest, MissingSocketFailsWithContext) {
    ApiClient client("/nonexistent/firecracker.sock", std::chrono::seconds(1));
    try {
        client.SetBootSource("/vmlinux", "console=ttyS0");
        FAIL() << "expected ExecutionError";
    } catch (const core::ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Failed to set boot source: ", 0), 0u);
    }
}

}  // namespace
}  // namespace pysandbox::executors::firecracker
