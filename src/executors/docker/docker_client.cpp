#include "executors/docker/docker_client.hpp"

#include <sys/socket.h>

#include <utility>

#include "httplib.h"
#include "utils/common.hpp"

namespace pysandbox::executors::docker {
namespace {

constexpr std::size_t kLogHeaderSize = 8;

std::string ErrorMessage(const httplib::Result& response) {
    if (!response) {
        return httplib::to_string(response.error());
    }
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("message")) {
        return body["message"].get<std::string>();
    }
    return response->body;
}

[[noreturn]] void Fail(const std::string& what, const httplib::Result& response) {
    const int status = response ? response->status : -1;
    throw DockerApiError(what + ": " + ErrorMessage(response), status);
}

}  // namespace

LogStreams DemultiplexLogs(const std::string& raw) {
    LogStreams streams{};
    std::size_t pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < kLogHeaderSize) {
            break;
        }
        const auto stream = static_cast<unsigned char>(raw[pos]);
        if (stream > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) {
            break;
        }
        const std::size_t size =
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[pos + 4])) << 24) |
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[pos + 5])) << 16) |
            (static_cast<std::size_t>(static_cast<unsigned char>(raw[pos + 6])) << 8) |
            static_cast<std::size_t>(static_cast<unsigned char>(raw[pos + 7]));
        pos += kLogHeaderSize;
        const auto chunk = raw.substr(pos, size);
        pos += chunk.size();
        if (stream == 2) {
            streams.err += chunk;
        } else {
            streams.out += chunk;
        }
    }
    if (pos == 0 && !raw.empty()) {
        streams.out = raw;
    }
    return streams;
}

DockerClient::DockerClient(std::string socket_path)
    : socket_path_(std::move(socket_path)) {}

std::unique_ptr<httplib::Client> DockerClient::MakeClient(std::chrono::seconds read_timeout) const {
    auto client = std::make_unique<httplib::Client>(socket_path_);
    client->set_address_family(AF_UNIX);
    client->set_connection_timeout(5);
    client->set_read_timeout(static_cast<time_t>(read_timeout.count()), 0);
    client->set_default_headers({{"Host", "localhost"}});
    return client;
}

bool DockerClient::Ping() const {
    auto client = MakeClient(std::chrono::seconds(5));
    auto response = client->Get("/_ping");
    return response && response->status == 200;
}

bool DockerClient::ImageExists(const std::string& image) const {
    auto client = MakeClient(std::chrono::seconds(10));
    auto response = client->Get("/images/" + image + "/json");
    return response && response->status == 200;
}

std::string DockerClient::CreateContainer(const nlohmann::json& spec) const {
    auto client = MakeClient(std::chrono::seconds(30));
    auto response = client->Post("/containers/create", spec.dump(), "application/json");
    if (!response || response->status != 201) {
        Fail("container create failed", response);
    }
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.contains("Id")) {
        throw DockerApiError("container create failed: missing container id", response->status);
    }
    return body["Id"].get<std::string>();
}

void DockerClient::StartContainer(const std::string& id) const {
    auto client = MakeClient(std::chrono::seconds(30));
    auto response = client->Post("/containers/" + id + "/start", "", "application/json");
    if (!response || (response->status != 204 && response->status != 304)) {
        Fail("container start failed", response);
    }
}

WaitResult DockerClient::WaitContainer(const std::string& id, std::chrono::seconds timeout) const {
    WaitResult result{};
    auto client = MakeClient(timeout);
    const auto start = utils::Now();
    auto response = client->Post("/containers/" + id + "/wait", "", "application/json");
    if (!response) {
        // The read deadline is the only thing that ends a healthy wait early.
        if (utils::SecondsSince(start) + 0.05 >= static_cast<double>(timeout.count())) {
            result.timed_out = true;
            return result;
        }
        Fail("container wait failed", response);
    }
    if (response->status != 200) {
        Fail("container wait failed", response);
    }
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.contains("StatusCode")) {
        throw DockerApiError("container wait failed: malformed response", response->status);
    }
    result.status_code = body["StatusCode"].get<std::int64_t>();
    return result;
}

std::string DockerClient::Logs(const std::string& id, bool stdout_stream, bool stderr_stream) const {
    auto client = MakeClient(std::chrono::seconds(30));
    const std::string path = "/containers/" + id + "/logs?stdout=" + (stdout_stream ? "1" : "0") +
                             "&stderr=" + (stderr_stream ? "1" : "0");
    auto response = client->Get(path);
    if (!response || response->status != 200) {
        Fail("container logs failed", response);
    }
    const auto streams = DemultiplexLogs(response->body);
    if (stdout_stream && stderr_stream) {
        return streams.out + streams.err;
    }
    return stderr_stream ? streams.err + streams.out : streams.out;
}

std::optional<std::string> DockerClient::Archive(const std::string& id, const std::string& path) const {
    auto client = MakeClient(std::chrono::seconds(60));
    auto response = client->Get("/containers/" + id + "/archive?path=" + path);
    if (response && response->status == 404) {
        return std::nullopt;
    }
    if (!response || response->status != 200) {
        Fail("container archive failed", response);
    }
    return response->body;
}

void DockerClient::RemoveContainer(const std::string& id, bool force) const {
    auto client = MakeClient(std::chrono::seconds(30));
    auto response = client->Delete("/containers/" + id + (force ? "?force=1" : ""));
    if (!response || (response->status != 204 && response->status != 404)) {
        Fail("container remove failed", response);
    }
}

}  // namespace pysandbox::executors::docker
