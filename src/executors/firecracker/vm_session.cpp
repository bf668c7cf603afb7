#include "executors/firecracker/vm_session.hpp"

#include <signal.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <utility>

#include <boost/process.hpp>

#include "executors/artifacts.hpp"
#include "executors/firecracker/api_client.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "vsock/frame_codec.hpp"

namespace pysandbox::executors::firecracker {
namespace bp = boost::process;

struct VmSession::Hypervisor {
    bp::child child;
};

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kAgentPollInterval = std::chrono::milliseconds(200);
constexpr auto kHandshakeTimeout = std::chrono::milliseconds(1000);

std::string ReadFile(const std::string& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

boost::filesystem::path ResolveBinary(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return boost::filesystem::exists(name) ? boost::filesystem::path(name) : boost::filesystem::path();
    }
    return bp::search_path(name);
}

void RemoveQuietly(const std::string& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kDebug, "vm") << "remove " << path << " failed: " << ec.message();
    }
}

std::string TimeoutMessage(int timeout_s) {
    return "Execution timeout after " + std::to_string(timeout_s) + " seconds";
}

}  // namespace

const char* ToString(VmState state) {
    switch (state) {
        case VmState::kCreated: return "created";
        case VmState::kProcessStarted: return "process_started";
        case VmState::kSocketReady: return "socket_ready";
        case VmState::kConfigured: return "configured";
        case VmState::kBooted: return "booted";
        case VmState::kExecuting: return "executing";
        case VmState::kExtracting: return "extracting";
        case VmState::kTornDown: return "torn_down";
    }
    return "unknown";
}

VmSession::VmSession(const config::FirecrackerConfig& config,
                     const config::LimitsConfig& limits,
                     std::shared_ptr<storage::Storage> storage,
                     ProcessHooks hooks,
                     std::string vm_id)
    : config_(config)
    , limits_(limits)
    , storage_(std::move(storage))
    , hooks_(std::move(hooks))
    , vm_id_(vm_id.empty() ? utils::NewId() : std::move(vm_id)) {
    const std::filesystem::path dir(config_.socket_dir);
    api_socket_ = (dir / (vm_id_ + ".sock")).string();
    vsock_path_ = (dir / (vm_id_ + ".vsock")).string();
    stderr_path_ = (std::filesystem::temp_directory_path() / ("pysandbox_fc_" + vm_id_ + ".log")).string();
}

VmSession::~VmSession() {
    Teardown();
}

void VmSession::Transition(VmState next) {
    utils::Log(utils::LogLevel::kDebug, "vm")
        << vm_id_.substr(0, 8) << " " << ToString(state_) << " -> " << ToString(next);
    state_ = next;
}

core::ExecutionResult VmSession::Run(const std::string& code, int timeout_s) {
    const auto start = utils::Now();
    core::ExecutionResult result{};
    try {
        StartProcess();
        Transition(VmState::kProcessStarted);
        WaitForApiSocket();
        Transition(VmState::kSocketReady);
        Configure();
        Transition(VmState::kConfigured);
        Boot();
        Transition(VmState::kBooted);

        Transition(VmState::kExecuting);
        result = ExecuteCode(code, timeout_s);

        if (storage_ && storage_->IsEnabled() && channel_ && channel_->IsOpen()) {
            Transition(VmState::kExtracting);
            result.files = ExtractFiles();
        }
    } catch (const core::TimeoutError&) {
        result = core::FailureResult(core::kErrorTimeout, TimeoutMessage(timeout_s), 0.0);
    } catch (const std::exception& e) {
        const std::string message = e.what();
        result = core::FailureResult("Firecracker execution failed: " + message, message, 0.0);
    }

    Teardown();
    result.execution_time = utils::SecondsSince(start);
    return result;
}

void VmSession::StartProcess() {
    const auto binary = ResolveBinary(config_.binary);
    if (binary.empty()) {
        throw core::ExecutionError("Failed to start Firecracker: binary not found: " + config_.binary);
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.socket_dir, ec);
    RemoveQuietly(api_socket_);

    try {
        process_ = std::make_unique<Hypervisor>(Hypervisor{bp::child(
            bp::exe = binary,
            bp::args = std::vector<std::string>{"--api-sock", api_socket_, "--id", vm_id_},
            bp::std_in < bp::null,
            bp::std_out > bp::null,
            bp::std_err > stderr_path_)});
    } catch (const bp::process_error& e) {
        throw core::ExecutionError(std::string("Failed to start Firecracker: ") + e.what());
    }
    pid_ = process_->child.id();
    if (hooks_.started) {
        hooks_.started(pid_);
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(config_.start_check_ms));
    std::error_code running_ec;
    if (!process_->child.running(running_ec)) {
        throw core::ExecutionError("Firecracker failed to start: " + utils::Trim(ReadFile(stderr_path_)));
    }
}

void VmSession::WaitForApiSocket() {
    const auto deadline = utils::Now() + std::chrono::milliseconds(config_.socket_wait_ms);
    while (utils::Now() < deadline) {
        std::error_code ec;
        if (std::filesystem::exists(api_socket_, ec)) {
            return;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    throw core::ExecutionError("Firecracker socket timeout");
}

void VmSession::Configure() {
    ApiClient api(api_socket_);
    api.Configure(config_, vsock_path_);
}

void VmSession::Boot() {
    ApiClient api(api_socket_);
    api.StartInstance();
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.boot_settle_ms));
}

void VmSession::ConnectToAgent() {
    const auto deadline = utils::Now() + std::chrono::milliseconds(config_.agent_wait_ms);
    std::string last_error = "no vsock socket";
    while (utils::Now() < deadline) {
        std::error_code ec;
        if (std::filesystem::exists(vsock_path_, ec)) {
            try {
                channel_ = vsock::ConnectThroughMultiplexer(io_, vsock_path_, config_.vsock_port,
                                                            kHandshakeTimeout);
                return;
            } catch (const std::exception& e) {
                last_error = e.what();
            }
        }
        std::this_thread::sleep_for(kAgentPollInterval);
    }
    throw core::ExecutionError("Guest agent not ready: " + last_error);
}

core::ExecutionResult VmSession::ExecuteCode(const std::string& code, int timeout_s) {
    try {
        ConnectToAgent();
        const nlohmann::json request = {
            {"action", "execute"},
            {"code", code},
            {"timeout", timeout_s}
        };
        const auto deadline = std::chrono::seconds(timeout_s + config_.response_grace_s);
        channel_->WriteFrame(core::DumpJson(request), kHandshakeTimeout);
        const auto payload = channel_->ReadFrame(std::chrono::duration_cast<vsock::Duration>(deadline));
        const auto response = vsock::ParseJsonPayload(payload);
        if (!response) {
            throw core::ExecutionError("malformed response from guest agent");
        }

        core::ExecutionResult result{};
        result.success = response->value("success", false);
        result.stdout_text = TruncateOutput(response->value("stdout", std::string()), limits_.max_output_size);
        result.stderr_text = TruncateOutput(response->value("stderr", std::string()), limits_.max_output_size);
        result.exit_code = response->value("exit_code", -1);
        const auto error = response->find("error");
        if (error != response->end() && error->is_string()) {
            result.error = error->get<std::string>();
        }
        return result;
    } catch (const core::TimeoutError&) {
        return core::FailureResult(core::kErrorTimeout, TimeoutMessage(timeout_s), 0.0);
    } catch (const std::exception& e) {
        const std::string message = e.what();
        return core::FailureResult("Code execution failed: " + message, message, 0.0);
    }
}

std::vector<std::string> VmSession::ExtractFiles() {
    ArtifactCollector collector(storage_, FileLimits::FromConfig(limits_), limits_.file_url_ttl_s,
                                vm_id_, "vm");
    const auto timeout = std::chrono::duration_cast<vsock::Duration>(
        std::chrono::seconds(config_.file_transfer_timeout_s));
    try {
        channel_->WriteFrame(core::DumpJson({{"action", "list_files"}, {"path", limits_.output_dir}}), timeout);
        const auto listing = vsock::ParseJsonPayload(channel_->ReadFrame(timeout));
        if (!listing || !listing->contains("files") || !(*listing)["files"].is_array()) {
            return {};
        }

        for (const auto& entry : (*listing)["files"]) {
            if (!entry.is_string()) {
                continue;
            }
            const auto name = entry.get<std::string>();
            const auto path = (std::filesystem::path(limits_.output_dir) / name).string();
            channel_->WriteFrame(core::DumpJson({{"action", "get_file"}, {"path", path}}), timeout);
            const auto length = channel_->ReadLength(timeout);

            const auto decision = collector.Admit(name, length);
            if (decision != ArtifactCollector::Decision::kAccept) {
                channel_->Discard(length, timeout);
                if (decision == ArtifactCollector::Decision::kStop) {
                    break;
                }
                continue;
            }
            collector.Store(name, channel_->ReadExact(length, timeout), path);
        }
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kWarn, "vm") << "failed to extract files: " << e.what();
    }
    return collector.Urls();
}

void VmSession::Teardown() {
    if (state_ == VmState::kTornDown) {
        return;
    }
    if (channel_) {
        channel_->Close();
        channel_.reset();
    }

    if (process_) {
        std::error_code ec;
        if (process_->child.running(ec)) {
            ::kill(pid_, SIGTERM);
            const auto deadline = utils::Now() + std::chrono::milliseconds(config_.teardown_wait_ms);
            while (process_->child.running(ec) && utils::Now() < deadline) {
                std::this_thread::sleep_for(kPollInterval);
            }
            if (process_->child.running(ec)) {
                process_->child.terminate(ec);
                if (ec) {
                    utils::Log(utils::LogLevel::kDebug, "vm") << "kill " << pid_ << " failed: " << ec.message();
                }
            }
        }
        process_->child.wait(ec);
        process_.reset();
        if (hooks_.stopped) {
            hooks_.stopped(pid_);
        }
    }

    RemoveQuietly(api_socket_);
    RemoveQuietly(vsock_path_);
    RemoveQuietly(stderr_path_);
    Transition(VmState::kTornDown);
}

}  // namespace pysandbox::executors::firecracker
