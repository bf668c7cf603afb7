#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"

namespace httplib {
class Client;
}

namespace pysandbox::executors::docker {

class DockerApiError : public core::ExecutionError {
public:
    DockerApiError(const std::string& message, int status)
        : core::ExecutionError(message)
        , status_(status) {}

    int Status() const { return status_; }

private:
    int status_;
};

struct WaitResult {
    bool timed_out = false;
    std::int64_t status_code = -1;
};

struct LogStreams {
    std::string out;
    std::string err;
};

// Splits the engine's multiplexed log stream: 8-byte headers
// {stream, 0, 0, 0, size(be32)} each followed by size payload bytes.
// Input without a valid header is returned as stdout unchanged.
LogStreams DemultiplexLogs(const std::string& raw);

// Minimal Docker Engine API client speaking HTTP over the daemon's Unix
// socket. Each call opens its own connection.
class DockerClient {
public:
    explicit DockerClient(std::string socket_path);

    bool Ping() const;
    bool ImageExists(const std::string& image) const;

    // Returns the new container id.
    std::string CreateContainer(const nlohmann::json& spec) const;
    void StartContainer(const std::string& id) const;
    WaitResult WaitContainer(const std::string& id, std::chrono::seconds timeout) const;
    std::string Logs(const std::string& id, bool stdout_stream, bool stderr_stream) const;
    // Tar stream of `path`; nothing when the path does not exist.
    std::optional<std::string> Archive(const std::string& id, const std::string& path) const;
    void RemoveContainer(const std::string& id, bool force) const;

    const std::string& SocketPath() const { return socket_path_; }

private:
    std::unique_ptr<httplib::Client> MakeClient(std::chrono::seconds read_timeout) const;

    std::string socket_path_;
};

}  // namespace pysandbox::executors::docker
