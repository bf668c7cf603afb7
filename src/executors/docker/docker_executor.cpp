#include "executors/docker/docker_executor.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::executors::docker {
namespace {

using ArchivePtr = std::unique_ptr<struct archive, int (*)(struct archive*)>;

}  // namespace

std::int64_t ParseMemorySize(const std::string& value) {
    const auto trimmed = utils::ToLower(utils::Trim(value));
    if (trimmed.empty()) {
        throw std::invalid_argument("empty memory size");
    }
    std::int64_t multiplier = 1;
    std::string digits = trimmed;
    switch (trimmed.back()) {
        case 'b': digits.pop_back(); break;
        case 'k': multiplier = 1024; digits.pop_back(); break;
        case 'm': multiplier = 1024 * 1024; digits.pop_back(); break;
        case 'g': multiplier = 1024LL * 1024 * 1024; digits.pop_back(); break;
        default: break;
    }
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("invalid memory size: " + value);
    }
    return std::stoll(digits) * multiplier;
}

nlohmann::json BuildContainerSpec(const config::DockerConfig& config, const std::string& code) {
    return {
        {"Image", config.image},
        {"Cmd", {config.interpreter, "-c", code}},
        {"NetworkDisabled", true},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"Tty", false},
        {"HostConfig", {
            {"Memory", ParseMemorySize(config.memory)},
            {"MemorySwap", ParseMemorySize(config.memory_swap)},
            {"CpuQuota", config.cpu_quota},
            {"CpuPeriod", config.cpu_period},
            {"PidsLimit", config.pids_limit},
            {"NetworkMode", "none"},
            {"ReadonlyRootfs", false},
            {"SecurityOpt", {"no-new-privileges"}},
            {"CapDrop", {"ALL"}},
            {"AutoRemove", false}
        }}
    };
}

void CollectFromTar(const std::string& tar, ArtifactCollector& collector) {
    ArchivePtr reader(archive_read_new(), archive_read_free);
    if (!reader) {
        throw core::ExecutionError("failed to allocate archive reader");
    }
    archive_read_support_format_tar(reader.get());
    if (archive_read_open_memory(reader.get(), tar.data(), tar.size()) != ARCHIVE_OK) {
        throw core::ExecutionError(std::string("failed to open archive: ") +
                                   archive_error_string(reader.get()));
    }

    struct archive_entry* entry = nullptr;
    while (true) {
        const int rc = archive_read_next_header(reader.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        }
        if (rc < ARCHIVE_WARN) {
            throw core::ExecutionError(std::string("failed to read archive: ") +
                                       archive_error_string(reader.get()));
        }
        if (archive_entry_filetype(entry) != AE_IFREG) {
            continue;
        }
        const std::string path = archive_entry_pathname(entry);
        const auto name = std::filesystem::path(path).filename().string();
        const auto size = static_cast<std::size_t>(archive_entry_size(entry));

        const auto decision = collector.Admit(name, size);
        if (decision == ArtifactCollector::Decision::kStop) {
            break;
        }
        if (decision == ArtifactCollector::Decision::kSkip) {
            continue;
        }

        std::string content(size, '\0');
        std::size_t offset = 0;
        while (offset < size) {
            const auto read = archive_read_data(reader.get(), &content[offset], size - offset);
            if (read < 0) {
                throw core::ExecutionError(std::string("failed to read ") + path + ": " +
                                           archive_error_string(reader.get()));
            }
            if (read == 0) {
                break;
            }
            offset += static_cast<std::size_t>(read);
        }
        content.resize(offset);
        collector.Store(name, content, path);
    }
}

DockerExecutor::DockerExecutor(const config::DockerConfig& docker,
                               const config::LimitsConfig& limits,
                               std::shared_ptr<storage::Storage> storage)
    : docker_(docker)
    , limits_(limits)
    , storage_(std::move(storage))
    , client_(std::make_unique<DockerClient>(docker.socket)) {
    if (!client_->Ping()) {
        throw core::ExecutionError("Failed to initialize Docker client: no engine answering on " +
                                   docker_.socket);
    }
    if (!client_->ImageExists(docker_.image)) {
        throw core::ExecutionError("Sandbox image '" + docker_.image +
                                   "' not found. Please build it first: docker build -t " +
                                   docker_.image + " sandbox-image/");
    }
    // Fail at startup rather than on the first request.
    ParseMemorySize(docker_.memory);
    ParseMemorySize(docker_.memory_swap);
    utils::Log(utils::LogLevel::kInfo, "docker") << "ready image=" << docker_.image
                                                  << " socket=" << docker_.socket;
}

core::ExecutionResult DockerExecutor::Execute(const std::string& code, int timeout_s) {
    const auto start = utils::Now();
    const auto execution_id = utils::NewId();
    std::string container_id;
    core::ExecutionResult result{};

    try {
        container_id = client_->CreateContainer(BuildContainerSpec(docker_, code));
        client_->StartContainer(container_id);
        utils::Log(utils::LogLevel::kDebug, "docker")
            << "started container " << container_id.substr(0, 12) << " execution=" << execution_id;

        const auto wait = client_->WaitContainer(container_id, std::chrono::seconds(timeout_s));
        if (wait.timed_out) {
            result = core::FailureResult(core::kErrorTimeout,
                                         "Execution timeout after " + std::to_string(timeout_s) +
                                             " seconds",
                                         0.0);
        } else {
            const auto stdout_text = TruncateOutput(client_->Logs(container_id, true, false),
                                                    limits_.max_output_size);
            const auto stderr_text = TruncateOutput(client_->Logs(container_id, false, true),
                                                    limits_.max_output_size);
            result.exit_code = static_cast<int>(wait.status_code);
            result.stderr_text = stderr_text;
            if (wait.status_code != 0) {
                result.success = false;
                result.error = core::kErrorContainer;
            } else {
                result.success = true;
                result.stdout_text = stdout_text;
                result.files = ExtractFiles(container_id, execution_id);
            }
        }
    } catch (const std::exception& e) {
        const std::string message = e.what();
        result = core::FailureResult(LooksLikeTimeout(message) ? core::kErrorTimeout : core::kErrorFailed,
                                     message, 0.0);
    }

    RemoveQuietly(container_id);
    result.execution_time = utils::SecondsSince(start);
    return result;
}

std::vector<std::string> DockerExecutor::ExtractFiles(const std::string& container_id,
                                                      const std::string& execution_id) {
    ArtifactCollector collector(storage_, FileLimits::FromConfig(limits_), limits_.file_url_ttl_s,
                                execution_id, "docker");
    if (!collector.Enabled()) {
        return {};
    }
    try {
        const auto archive = client_->Archive(container_id, limits_.output_dir);
        if (!archive) {
            return {};
        }
        CollectFromTar(*archive, collector);
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kWarn, "docker") << "failed to extract files from container: " << e.what();
    }
    return collector.Urls();
}

void DockerExecutor::RemoveQuietly(const std::string& container_id) {
    if (container_id.empty()) {
        return;
    }
    try {
        client_->RemoveContainer(container_id, true);
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kDebug, "docker")
            << "remove " << container_id.substr(0, 12) << " failed: " << e.what();
    }
}

bool DockerExecutor::HealthCheck() {
    return client_->Ping() && client_->ImageExists(docker_.image);
}

void DockerExecutor::Cleanup() {
    utils::Log(utils::LogLevel::kDebug, "docker") << "cleanup: nothing held beyond the engine socket";
}

}  // namespace pysandbox::executors::docker
