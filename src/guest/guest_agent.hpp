#pragma once

#include <string>

#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>

#include "nlohmann/json.hpp"
#include "vsock/channel.hpp"

namespace pysandbox::guest {

struct AgentOptions {
    int port = 5000;
    std::string output_dir = "/tmp/output";
    std::string interpreter = "python3";
    // Listen on this Unix socket instead of vsock when set.
    std::string unix_path;
};

// Runs inside the microVM and answers the host's framed JSON requests.
class GuestAgent {
public:
    explicit GuestAgent(AgentOptions options);

    // Serves one connection until the peer closes or a request cannot be parsed.
    void ServeConnection(vsock::Channel& channel) const;
    // Handles one request; false ends the connection.
    bool HandleRequest(vsock::Channel& channel) const;

    nlohmann::json HandleExecute(const nlohmann::json& request) const;
    nlohmann::json HandleListFiles(const nlohmann::json& request) const;
    // Raw length-prefixed bytes; a zero length for anything unreadable.
    std::string ReadFileFrame(const nlohmann::json& request) const;

    // Accepts connections serially, forever.
    void Run(boost::asio::io_context& io);

    const AgentOptions& Options() const { return options_; }

private:
    boost::asio::generic::stream_protocol::endpoint ListenEndpoint() const;

    AgentOptions options_;
};

}  // namespace pysandbox::guest
