#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace pysandbox::config {

struct ServerConfig {
    std::string app_name = "Python Sandbox";
    std::string version = "1.0.0";
    std::string host = "0.0.0.0";
    int port = 8000;
};

struct LoggingConfig {
    std::string level = "info";
};

struct ValidatorConfig {
    std::vector<std::string> forbidden_imports = {
        "os", "subprocess", "socket", "sys",
        "importlib", "ctypes", "__builtin__",
        "builtins", "multiprocessing", "threading"
    };
    int max_code_length = 50000;
    int max_complexity = 20;
};

struct LimitsConfig {
    int min_timeout_s = 1;
    int max_timeout_s = 30;
    int default_timeout_s = 10;
    std::size_t max_output_size = 10240;
    std::size_t max_file_size = 10485760;
    std::size_t max_total_size = 52428800;
    std::size_t max_file_count = 10;
    int file_url_ttl_s = 18000;
    std::string output_dir = "/tmp/output";
};

struct ExecutorConfig {
    std::string provider = "docker";
    // Comma-separated, tried in order after the primary.
    std::string fallback_providers = "docker";
};

struct DockerConfig {
    std::string socket = "/var/run/docker.sock";
    std::string image = "python-sandbox:latest";
    std::string interpreter = "python";
    std::string memory = "128m";
    std::string memory_swap = "128m";
    std::int64_t cpu_quota = 50000;
    std::int64_t cpu_period = 100000;
    std::int64_t pids_limit = 50;
};

struct FirecrackerConfig {
    std::string binary = "firecracker";
    std::string kernel_path = "/var/firecracker/vmlinux";
    std::string rootfs_path = "/var/firecracker/rootfs.ext4";
    std::string socket_dir = "/tmp/firecracker";
    std::string boot_args = "console=ttyS0 reboot=k panic=1 pci=off quiet";
    int memory_mb = 128;
    int vcpu_count = 1;
    int guest_cid = 3;
    int vsock_port = 5000;
    int start_check_ms = 100;
    int socket_wait_ms = 5000;
    int boot_settle_ms = 500;
    int agent_wait_ms = 10000;
    int response_grace_s = 5;
    int file_transfer_timeout_s = 30;
    int teardown_wait_ms = 5000;
};

struct R2Config {
    std::string bucket;
    std::string account_id;
    std::string access_key;
    std::string secret_key;
    std::string prefix = "sandbox";
    std::string public_url;
    // Overrides https://<account_id>.r2.cloudflarestorage.com when set.
    std::string endpoint;
};

struct StorageConfig {
    bool enabled = false;
    std::string provider = "r2";
    R2Config r2;
};

struct Config {
    ServerConfig server;
    LoggingConfig logging;
    ValidatorConfig validator;
    LimitsConfig limits;
    ExecutorConfig executor;
    DockerConfig docker;
    FirecrackerConfig firecracker;
    StorageConfig storage;
};

}  // namespace pysandbox::config
