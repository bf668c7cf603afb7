#include "config/config_loader.hpp"

#include <cstdlib>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::config {
namespace {

using utils::GetEnv;
using utils::LogLevel;

std::string GetEnvFallback(const std::string& primary, const std::string& secondary) {
    auto value = GetEnv(primary.c_str());
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary.c_str());
}

// PYSANDBOX_DOCKER__IMAGE, then PYSANDBOX_DOCKER_IMAGE.
std::string GetSectionEnv(const char* section, const char* key) {
    const std::string base = std::string("PYSANDBOX_") + section;
    return GetEnvFallback(base + "__" + key, base + "_" + key);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

template <typename T>
T ParseNumber(const std::string& value, T fallback) {
    try {
        return static_cast<T>(std::stoll(value));
    } catch (const std::exception&) {
        utils::Log(LogLevel::kWarn, "config") << "ignoring non-numeric value '" << value << "'";
        return fallback;
    }
}

void ReadString(const nlohmann::json& object, const char* key, std::string& target) {
    if (object.contains(key) && object[key].is_string()) {
        target = object[key].get<std::string>();
    }
}

template <typename T>
void ReadNumber(const nlohmann::json& object, const char* key, T& target) {
    if (object.contains(key) && object[key].is_number_integer()) {
        target = object[key].get<T>();
    }
}

void ReadBool(const nlohmann::json& object, const char* key, bool& target) {
    if (object.contains(key) && object[key].is_boolean()) {
        target = object[key].get<bool>();
    }
}

// Accepts a JSON array of strings or one comma-separated string.
void ReadList(const nlohmann::json& object, const char* key, std::vector<std::string>& target) {
    if (!object.contains(key)) {
        return;
    }
    const auto& value = object[key];
    if (value.is_string()) {
        target = utils::SplitCsv(value.get<std::string>());
    } else if (value.is_array()) {
        target.clear();
        for (const auto& item : value) {
            if (item.is_string()) {
                const auto trimmed = utils::Trim(item.get<std::string>());
                if (!trimmed.empty()) {
                    target.push_back(trimmed);
                }
            }
        }
    }
}

const nlohmann::json* Section(const nlohmann::json& data, const char* name) {
    if (data.contains(name) && data[name].is_object()) {
        return &data[name];
    }
    return nullptr;
}

void EnvString(const char* section, const char* key, std::string& target) {
    const auto value = GetSectionEnv(section, key);
    if (!value.empty()) {
        target = value;
    }
}

template <typename T>
void EnvNumber(const char* section, const char* key, T& target) {
    const auto value = GetSectionEnv(section, key);
    if (!value.empty()) {
        target = ParseNumber<T>(value, target);
    }
}

void EnvBool(const char* section, const char* key, bool& target) {
    const auto value = GetSectionEnv(section, key);
    if (!value.empty()) {
        target = ParseBool(value);
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("PYSANDBOX_CONFIG");
    if (!explicit_path.empty()) {
        return explicit_path;
    }
    return GetHomePath() / ".pysandbox" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (const auto* server = Section(data, "server")) {
        ReadString(*server, "appName", config.server.app_name);
        ReadString(*server, "version", config.server.version);
        ReadString(*server, "host", config.server.host);
        ReadNumber(*server, "port", config.server.port);
    }

    if (const auto* logging = Section(data, "logging")) {
        ReadString(*logging, "level", config.logging.level);
    }

    if (const auto* validator = Section(data, "validator")) {
        ReadList(*validator, "forbiddenImports", config.validator.forbidden_imports);
        ReadNumber(*validator, "maxCodeLength", config.validator.max_code_length);
        ReadNumber(*validator, "maxComplexity", config.validator.max_complexity);
    }

    if (const auto* limits = Section(data, "limits")) {
        ReadNumber(*limits, "minTimeoutS", config.limits.min_timeout_s);
        ReadNumber(*limits, "maxTimeoutS", config.limits.max_timeout_s);
        ReadNumber(*limits, "defaultTimeoutS", config.limits.default_timeout_s);
        ReadNumber(*limits, "maxOutputSize", config.limits.max_output_size);
        ReadNumber(*limits, "maxFileSize", config.limits.max_file_size);
        ReadNumber(*limits, "maxTotalSize", config.limits.max_total_size);
        ReadNumber(*limits, "maxFileCount", config.limits.max_file_count);
        ReadNumber(*limits, "fileUrlTtlS", config.limits.file_url_ttl_s);
        ReadString(*limits, "outputDir", config.limits.output_dir);
    }

    if (const auto* executor = Section(data, "executor")) {
        ReadString(*executor, "provider", config.executor.provider);
        if (executor->contains("fallbackProviders")) {
            std::vector<std::string> fallbacks;
            ReadList(*executor, "fallbackProviders", fallbacks);
            config.executor.fallback_providers = utils::Join(fallbacks, ",");
        }
    }

    if (const auto* docker = Section(data, "docker")) {
        ReadString(*docker, "socket", config.docker.socket);
        ReadString(*docker, "image", config.docker.image);
        ReadString(*docker, "interpreter", config.docker.interpreter);
        ReadString(*docker, "memory", config.docker.memory);
        ReadString(*docker, "memorySwap", config.docker.memory_swap);
        ReadNumber(*docker, "cpuQuota", config.docker.cpu_quota);
        ReadNumber(*docker, "cpuPeriod", config.docker.cpu_period);
        ReadNumber(*docker, "pidsLimit", config.docker.pids_limit);
    }

    if (const auto* firecracker = Section(data, "firecracker")) {
        auto& target = config.firecracker;
        ReadString(*firecracker, "binary", target.binary);
        ReadString(*firecracker, "kernelPath", target.kernel_path);
        ReadString(*firecracker, "rootfsPath", target.rootfs_path);
        ReadString(*firecracker, "socketDir", target.socket_dir);
        ReadString(*firecracker, "bootArgs", target.boot_args);
        ReadNumber(*firecracker, "memoryMb", target.memory_mb);
        ReadNumber(*firecracker, "vcpuCount", target.vcpu_count);
        ReadNumber(*firecracker, "guestCid", target.guest_cid);
        ReadNumber(*firecracker, "vsockPort", target.vsock_port);
        ReadNumber(*firecracker, "startCheckMs", target.start_check_ms);
        ReadNumber(*firecracker, "socketWaitMs", target.socket_wait_ms);
        ReadNumber(*firecracker, "bootSettleMs", target.boot_settle_ms);
        ReadNumber(*firecracker, "agentWaitMs", target.agent_wait_ms);
        ReadNumber(*firecracker, "responseGraceS", target.response_grace_s);
        ReadNumber(*firecracker, "fileTransferTimeoutS", target.file_transfer_timeout_s);
        ReadNumber(*firecracker, "teardownWaitMs", target.teardown_wait_ms);
    }

    if (const auto* storage = Section(data, "storage")) {
        ReadBool(*storage, "enabled", config.storage.enabled);
        ReadString(*storage, "provider", config.storage.provider);
        if (const auto* r2 = Section(*storage, "r2")) {
            ReadString(*r2, "bucket", config.storage.r2.bucket);
            ReadString(*r2, "accountId", config.storage.r2.account_id);
            ReadString(*r2, "accessKey", config.storage.r2.access_key);
            ReadString(*r2, "secretKey", config.storage.r2.secret_key);
            ReadString(*r2, "prefix", config.storage.r2.prefix);
            ReadString(*r2, "publicUrl", config.storage.r2.public_url);
            ReadString(*r2, "endpoint", config.storage.r2.endpoint);
        }
    }
}

void ApplyConfigFromEnv(Config& config) {
    EnvString("SERVER", "HOST", config.server.host);
    EnvNumber("SERVER", "PORT", config.server.port);

    EnvString("LOGGING", "LEVEL", config.logging.level);
    const auto log_level = GetEnv("PYSANDBOX_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }

    const auto forbidden = GetSectionEnv("VALIDATOR", "FORBIDDEN_IMPORTS");
    if (!forbidden.empty()) {
        config.validator.forbidden_imports = utils::SplitCsv(forbidden);
    }
    EnvNumber("VALIDATOR", "MAX_CODE_LENGTH", config.validator.max_code_length);
    EnvNumber("VALIDATOR", "MAX_COMPLEXITY", config.validator.max_complexity);

    EnvNumber("LIMITS", "MIN_TIMEOUT_S", config.limits.min_timeout_s);
    EnvNumber("LIMITS", "MAX_TIMEOUT_S", config.limits.max_timeout_s);
    EnvNumber("LIMITS", "DEFAULT_TIMEOUT_S", config.limits.default_timeout_s);
    EnvNumber("LIMITS", "MAX_OUTPUT_SIZE", config.limits.max_output_size);
    EnvNumber("LIMITS", "MAX_FILE_SIZE", config.limits.max_file_size);
    EnvNumber("LIMITS", "MAX_TOTAL_SIZE", config.limits.max_total_size);
    EnvNumber("LIMITS", "MAX_FILE_COUNT", config.limits.max_file_count);
    EnvNumber("LIMITS", "FILE_URL_TTL_S", config.limits.file_url_ttl_s);
    EnvString("LIMITS", "OUTPUT_DIR", config.limits.output_dir);

    EnvString("EXECUTOR", "PROVIDER", config.executor.provider);
    EnvString("EXECUTOR", "FALLBACK_PROVIDERS", config.executor.fallback_providers);

    EnvString("DOCKER", "SOCKET", config.docker.socket);
    EnvString("DOCKER", "IMAGE", config.docker.image);
    EnvString("DOCKER", "INTERPRETER", config.docker.interpreter);
    EnvString("DOCKER", "MEMORY", config.docker.memory);
    EnvString("DOCKER", "MEMORY_SWAP", config.docker.memory_swap);
    EnvNumber("DOCKER", "CPU_QUOTA", config.docker.cpu_quota);
    EnvNumber("DOCKER", "CPU_PERIOD", config.docker.cpu_period);
    EnvNumber("DOCKER", "PIDS_LIMIT", config.docker.pids_limit);

    EnvString("FIRECRACKER", "BINARY", config.firecracker.binary);
    EnvString("FIRECRACKER", "KERNEL_PATH", config.firecracker.kernel_path);
    EnvString("FIRECRACKER", "ROOTFS_PATH", config.firecracker.rootfs_path);
    EnvString("FIRECRACKER", "SOCKET_DIR", config.firecracker.socket_dir);
    EnvString("FIRECRACKER", "BOOT_ARGS", config.firecracker.boot_args);
    EnvNumber("FIRECRACKER", "MEMORY_MB", config.firecracker.memory_mb);
    EnvNumber("FIRECRACKER", "VCPU_COUNT", config.firecracker.vcpu_count);
    EnvNumber("FIRECRACKER", "GUEST_CID", config.firecracker.guest_cid);
    EnvNumber("FIRECRACKER", "VSOCK_PORT", config.firecracker.vsock_port);

    EnvBool("STORAGE", "ENABLED", config.storage.enabled);
    EnvString("STORAGE", "PROVIDER", config.storage.provider);
    EnvString("STORAGE", "R2_BUCKET", config.storage.r2.bucket);
    EnvString("STORAGE", "R2_ACCOUNT_ID", config.storage.r2.account_id);
    EnvString("STORAGE", "R2_ACCESS_KEY", config.storage.r2.access_key);
    EnvString("STORAGE", "R2_SECRET_KEY", config.storage.r2.secret_key);
    EnvString("STORAGE", "R2_PREFIX", config.storage.r2.prefix);
    EnvString("STORAGE", "R2_PUBLIC_URL", config.storage.r2.public_url);
    EnvString("STORAGE", "R2_ENDPOINT", config.storage.r2.endpoint);
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(LogLevel::kWarn, "config") << "keeping defaults, failed to parse "
                                                  << config_path.string() << ": " << ex.what();
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

}  // namespace pysandbox::config
