#pragma once

#include <memory>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "service/execution_service.hpp"

namespace httplib {
class Server;
}

namespace pysandbox::server {

// Body returned alongside a 4xx/5xx status. Mirrors ExecutionResult so
// callers can parse every /execute response the same way.
nlohmann::json ErrorBody(const std::string& error, const std::string& message);

// JSON front door: POST /execute, GET /health, GET /.
class HttpServer {
public:
    HttpServer(const config::ServerConfig& config, service::ExecutionService& service);
    ~HttpServer();

    // Blocks until Stop().
    bool Listen();
    // Binds an ephemeral port on host and returns it; serve with ListenAfterBind().
    int BindToAnyPort(const std::string& host);
    bool ListenAfterBind();
    void Stop();
    bool IsRunning() const;

private:
    void RegisterRoutes();

    config::ServerConfig config_;
    service::ExecutionService& service_;
    std::unique_ptr<httplib::Server> server_;
};

}  // namespace pysandbox::server
