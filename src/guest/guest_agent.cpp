#include "guest/guest_agent.hpp"

#include <linux/vm_sockets.h>
#include <sys/socket.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

#include <boost/asio/basic_socket_acceptor.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include "core/types.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/logging.hpp"
#include "vsock/frame_codec.hpp"

namespace pysandbox::guest {
namespace {

int TimeoutOf(const nlohmann::json& request) {
    const auto it = request.find("timeout");
    if (it != request.end() && it->is_number()) {
        return it->get<int>();
    }
    return 30;
}

std::string StringField(const nlohmann::json& request, const char* key, const std::string& fallback) {
    const auto it = request.find(key);
    if (it != request.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

}  // namespace

GuestAgent::GuestAgent(AgentOptions options)
    : options_(std::move(options)) {
    std::error_code ec;
    std::filesystem::create_directories(options_.output_dir, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "agent")
            << "cannot create " << options_.output_dir << ": " << ec.message();
    }
}

nlohmann::json GuestAgent::HandleExecute(const nlohmann::json& request) const {
    const auto code = StringField(request, "code", "");
    const int timeout = TimeoutOf(request);

    sandbox::ProcessOptions process{};
    process.argv = {options_.interpreter, "-c", code};
    process.working_dir = options_.output_dir;
    process.timeout = std::chrono::seconds(timeout);

    const auto outcome = sandbox::ProcessRunner::Run(process);
    if (outcome.timed_out) {
        return {
            {"success", false},
            {"stdout", ""},
            {"stderr", "Execution timeout after " + std::to_string(timeout) + " seconds"},
            {"exit_code", -1},
            {"error", core::kErrorTimeout}
        };
    }
    if (!outcome.launched) {
        return {
            {"success", false},
            {"stdout", ""},
            {"stderr", outcome.error},
            {"exit_code", -1},
            {"error", core::kErrorFailed}
        };
    }
    return {
        {"success", outcome.exit_code == 0},
        {"stdout", outcome.output},
        {"stderr", outcome.error},
        {"exit_code", outcome.exit_code}
    };
}

nlohmann::json GuestAgent::HandleListFiles(const nlohmann::json& request) const {
    const std::filesystem::path dir = StringField(request, "path", options_.output_dir);
    nlohmann::json files = nlohmann::json::array();
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return {{"files", files}};
    }
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        return {{"error", ec.message()}, {"files", files}};
    }
    return {{"files", files}};
}

std::string GuestAgent::ReadFileFrame(const nlohmann::json& request) const {
    const std::filesystem::path path = StringField(request, "path", "");
    std::error_code ec;
    if (path.empty() || !std::filesystem::is_regular_file(path, ec)) {
        return vsock::EncodeLength(0);
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        utils::Log(utils::LogLevel::kWarn, "agent") << "cannot open " << path.string();
        return vsock::EncodeLength(0);
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    const auto content = buffer.str();
    if (content.size() > vsock::kMaxFrameSize) {
        utils::Log(utils::LogLevel::kWarn, "agent") << "file too large to send: " << path.string();
        return vsock::EncodeLength(0);
    }
    return vsock::EncodeFrame(content);
}

bool GuestAgent::HandleRequest(vsock::Channel& channel) const {
    std::string payload;
    try {
        payload = channel.ReadFrame();
    } catch (const vsock::ConnectionClosed&) {
        return false;
    }
    const auto request = vsock::ParseJsonPayload(payload);
    if (!request) {
        utils::Log(utils::LogLevel::kWarn, "agent") << "malformed request, closing connection";
        return false;
    }

    const auto action = StringField(*request, "action", "");
    utils::Log(utils::LogLevel::kInfo, "agent") << "action=" << action;
    if (action == "execute") {
        channel.WriteFrame(core::DumpJson(HandleExecute(*request)));
    } else if (action == "list_files") {
        channel.WriteFrame(core::DumpJson(HandleListFiles(*request)));
    } else if (action == "get_file") {
        channel.Write(ReadFileFrame(*request));
    } else {
        channel.WriteFrame(core::DumpJson({{"error", "Unknown action: " + action}}));
    }
    return true;
}

void GuestAgent::ServeConnection(vsock::Channel& channel) const {
    try {
        while (HandleRequest(channel)) {
        }
    } catch (const std::exception& e) {
        utils::Log(utils::LogLevel::kWarn, "agent") << "connection error: " << e.what();
    }
    channel.Close();
}

boost::asio::generic::stream_protocol::endpoint GuestAgent::ListenEndpoint() const {
    if (!options_.unix_path.empty()) {
        std::error_code ec;
        std::filesystem::remove(options_.unix_path, ec);
        return boost::asio::generic::stream_protocol::endpoint(
            boost::asio::local::stream_protocol::endpoint(options_.unix_path));
    }
    sockaddr_vm address{};
    address.svm_family = AF_VSOCK;
    address.svm_cid = VMADDR_CID_ANY;
    address.svm_port = static_cast<unsigned int>(options_.port);
    return boost::asio::generic::stream_protocol::endpoint(&address, sizeof(address));
}

void GuestAgent::Run(boost::asio::io_context& io) {
    const auto endpoint = ListenEndpoint();
    boost::asio::basic_socket_acceptor<boost::asio::generic::stream_protocol> acceptor(io, endpoint);
    if (options_.unix_path.empty()) {
        utils::Log(utils::LogLevel::kInfo, "agent") << "listening on vsock port " << options_.port;
    } else {
        utils::Log(utils::LogLevel::kInfo, "agent") << "listening on " << options_.unix_path;
    }

    while (true) {
        vsock::Socket socket(io);
        boost::system::error_code ec;
        acceptor.accept(socket, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, "agent") << "accept failed: " << ec.message();
            continue;
        }
        utils::Log(utils::LogLevel::kInfo, "agent") << "connection accepted";
        vsock::Channel channel(io, std::move(socket));
        ServeConnection(channel);
    }
}

}  // namespace pysandbox::guest
