#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "core/errors.hpp"
#include "executors/firecracker/firecracker_executor.hpp"
#include "utils/common.hpp"

namespace pysandbox::executors::firecracker {
namespace {

class FirecrackerExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / ("pysandbox_fc_" + utils::NewId());
        std::filesystem::create_directories(root_);
        config_.binary = Script("firecracker", "echo 'Firecracker v1.7.0'");
        config_.kernel_path = Touch("vmlinux");
        config_.rootfs_path = Touch("rootfs.ext4");
        config_.socket_dir = (root_ / "sockets").string();
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::string Script(const std::string& name, const std::string& body) {
        const auto path = root_ / name;
        {
            std::ofstream script(path);
            script << "#!/bin/sh\n" << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path.string();
    }

    std::string Touch(const std::string& name) {
        const auto path = root_ / name;
        std::ofstream file(path);
        file << "image";
        return path.string();
    }

    std::string ConstructionError() {
        try {
            FirecrackerExecutor executor(config_, limits_, nullptr);
        } catch (const core::ExecutionError& e) {
            return e.what();
        }
        return {};
    }

    std::filesystem::path root_;
    config::FirecrackerConfig config_;
    config::LimitsConfig limits_;
};

TEST_F(FirecrackerExecutorTest, MissingBinary) {
    config_.binary = "/nonexistent/firecracker";
    EXPECT_EQ(ConstructionError(),
              "Firecracker binary not found (/nonexistent/firecracker). Install Firecracker and make "
              "sure it is on PATH");
}

TEST_F(FirecrackerExecutorTest, BrokenBinary) {
    config_.binary = Script("broken", "exit 2");
    EXPECT_EQ(ConstructionError(), "Firecracker binary not working properly");
}

TEST_F(FirecrackerExecutorTest, MissingKernel) {
    config_.kernel_path = (root_ / "missing-vmlinux").string();
    EXPECT_EQ(ConstructionError(), "Firecracker kernel not found: " + config_.kernel_path);
}

TEST_F(FirecrackerExecutorTest, MissingRootfs) {
    config_.rootfs_path = (root_ / "missing.ext4").string();
    EXPECT_EQ(ConstructionError(), "Firecracker rootfs not found: " + config_.rootfs_path);
}

TEST_F(FirecrackerExecutorTest, RequiresKvm) {
    if (std::filesystem::exists(kKvmDevice)) {
        GTEST_SKIP() << "host has KVM";
    }
    EXPECT_EQ(ConstructionError(), "/dev/kvm not found. Enable KVM on this host");
}

TEST_F(FirecrackerExecutorTest, CleanupRemovesOnlySocketFiles) {
    if (!std::filesystem::exists(kKvmDevice)) {
        GTEST_SKIP() << "host has no KVM";
    }
    FirecrackerExecutor executor(config_, limits_, nullptr);
    EXPECT_TRUE(executor.HealthCheck());
    EXPECT_TRUE(std::filesystem::is_directory(config_.socket_dir));

    const std::filesystem::path dir(config_.socket_dir);
    std::ofstream(dir / "stale.sock") << "";
    std::ofstream(dir / "stale.vsock") << "";
    std::ofstream(dir / "notes.txt") << "keep";

    executor.Cleanup();
    EXPECT_FALSE(std::filesystem::exists(dir / "stale.sock"));
    EXPECT_FALSE(std::filesystem::exists(dir / "stale.vsock"));
    EXPECT_TRUE(std::filesystem::exists(dir / "notes.txt"));
    EXPECT_TRUE(executor.LivePids().empty());
}

}  // namespace
}  // namespace pysandbox::executors::firecracker
