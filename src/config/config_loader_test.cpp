#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "config/config_loader.hpp"
#include "utils/common.hpp"

namespace pysandbox::config {
namespace {

// Sets a variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value)
        : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_.c_str()); }

private:
    std::string name_;
};

TEST(ConfigLoaderTest, DefaultsMatchServiceLimits) {
    const Config config{};
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.validator.max_code_length, 50000);
    EXPECT_EQ(config.validator.max_complexity, 20);
    EXPECT_EQ(config.validator.forbidden_imports.size(), 10u);
    EXPECT_EQ(config.limits.min_timeout_s, 1);
    EXPECT_EQ(config.limits.max_timeout_s, 30);
    EXPECT_EQ(config.limits.max_output_size, 10240u);
    EXPECT_EQ(config.limits.max_file_count, 10u);
    EXPECT_EQ(config.executor.provider, "docker");
    EXPECT_EQ(config.firecracker.vsock_port, 5000);
    EXPECT_FALSE(config.storage.enabled);
}

TEST(ConfigLoaderTest, AppliesCamelCaseJson) {
    Config config{};
    const auto data = nlohmann::json::parse(R"({
        "server": {"port": 9001, "host": "127.0.0.1"},
        "validator": {"forbiddenImports": ["os", " socket ", ""], "maxComplexity": 5},
        "limits": {"maxTimeoutS": 60, "outputDir": "/srv/out"},
        "executor": {"provider": "firecracker", "fallbackProviders": ["docker", "local"]},
        "docker": {"memory": "256m", "pidsLimit": 20},
        "firecracker": {"memoryMb": 512, "socketDir": "/run/fc"},
        "storage": {"enabled": true, "r2": {"bucket": "files", "accountId": "acct"}}
    })");
    ApplyConfigFromJson(config, data);

    EXPECT_EQ(config.server.port, 9001);
    EXPECT_EQ(config.server.host, "127.0.0.1");
    EXPECT_EQ(config.validator.forbidden_imports, (std::vector<std::string>{"os", "socket"}));
    EXPECT_EQ(config.validator.max_complexity, 5);
    EXPECT_EQ(config.validator.max_code_length, 50000);
    EXPECT_EQ(config.limits.max_timeout_s, 60);
    EXPECT_EQ(config.limits.output_dir, "/srv/out");
    EXPECT_EQ(config.executor.provider, "firecracker");
    EXPECT_EQ(config.executor.fallback_providers, "docker,local");
    EXPECT_EQ(config.docker.memory, "256m");
    EXPECT_EQ(config.docker.pids_limit, 20);
    EXPECT_EQ(config.firecracker.memory_mb, 512);
    EXPECT_EQ(config.firecracker.socket_dir, "/run/fc");
    EXPECT_TRUE(config.storage.enabled);
    EXPECT_EQ(config.storage.r2.bucket, "files");
    EXPECT_EQ(config.storage.r2.account_id, "acct");
}

TEST(ConfigLoaderTest, IgnoresWrongTypes) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(
        R"({"server": {"port": "9001"}, "validator": {"forbiddenImports": "os, sys"}, "logging": 3})"));
    EXPECT_EQ(config.server.port, 8000);
    EXPECT_EQ(config.validator.forbidden_imports, (std::vector<std::string>{"os", "sys"}));
    EXPECT_EQ(config.logging.level, "info");

    ApplyConfigFromJson(config, nlohmann::json::array());
    EXPECT_EQ(config.server.port, 8000);
}

TEST(ConfigLoaderTest, EnvironmentOverridesJson) {
    ScopedEnv port("PYSANDBOX_SERVER__PORT", "7000");
    ScopedEnv image("PYSANDBOX_DOCKER_IMAGE", "sandbox:test");
    ScopedEnv forbidden("PYSANDBOX_VALIDATOR__FORBIDDEN_IMPORTS", "os,pickle");
    ScopedEnv enabled("PYSANDBOX_STORAGE__ENABLED", "yes");
    ScopedEnv bad("PYSANDBOX_LIMITS__MAX_FILE_COUNT", "many");

    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"server": {"port": 9001}})"));
    ApplyConfigFromEnv(config);

    EXPECT_EQ(config.server.port, 7000);
    EXPECT_EQ(config.docker.image, "sandbox:test");
    EXPECT_EQ(config.validator.forbidden_imports, (std::vector<std::string>{"os", "pickle"}));
    EXPECT_TRUE(config.storage.enabled);
    EXPECT_EQ(config.limits.max_file_count, 10u);
}

TEST(ConfigLoaderTest, LoadsFileThenEnvironment) {
    const auto path = std::filesystem::temp_directory_path() / ("pysandbox_config_" + utils::NewId() + ".json");
    {
        std::ofstream file(path);
        file << R"({"executor": {"provider": "firecracker"}, "limits": {"defaultTimeoutS": 5}})";
    }
    ScopedEnv provider("PYSANDBOX_EXECUTOR__PROVIDER", "docker");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.executor.provider, "docker");
    EXPECT_EQ(config.limits.default_timeout_s, 5);

    std::filesystem::remove(path);
}

TEST(ConfigLoaderTest, KeepsDefaultsOnBrokenFile) {
    const auto path = std::filesystem::temp_directory_path() / ("pysandbox_config_" + utils::NewId() + ".json");
    {
        std::ofstream file(path);
        file << "{not json";
    }
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.server.port, 8000);
    std::filesystem::remove(path);

    EXPECT_EQ(LoadConfig(path).executor.provider, "docker");
}

TEST(ConfigLoaderTest, ConfigPathFromEnvironment) {
    ScopedEnv explicit_path("PYSANDBOX_CONFIG", "/etc/pysandbox.json");
    EXPECT_EQ(GetConfigPath(), std::filesystem::path("/etc/pysandbox.json"));
}

}  // namespace
}  // namespace pysandbox::config
