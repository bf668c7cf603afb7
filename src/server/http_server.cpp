#include "server/http_server.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <limits>
#include <utility>

#include "core/errors.hpp"
#include "core/types.hpp"
#include "httplib.h"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace pysandbox::server {
namespace {

using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

// Saturates to the int range so out-of-range values fail the bounds check.
int ClampTimeout(const nlohmann::json& value) {
    constexpr auto kMax = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    constexpr auto kMin = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    if (value.is_number_unsigned()) {
        return static_cast<int>(std::min<std::uint64_t>(value.get<std::uint64_t>(), kMax));
    }
    return static_cast<int>(std::clamp(value.get<std::int64_t>(), kMin, kMax));
}

void SetJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(core::DumpJson(body), "application/json");
}

// Access line per request, "METHOD path - status - seconds".
Handler Logged(Handler handler) {
    return [handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
        const auto start = utils::Now();
        handler(req, res);
        utils::Log(utils::LogLevel::kInfo, "http")
            << req.method << " " << req.path << " - " << res.status << " - "
            << utils::SecondsSince(start) << "s";
    };
}

}  // namespace

nlohmann::json ErrorBody(const std::string& error, const std::string& message) {
    return {
        {"success", false},
        {"error", error},
        {"message", message},
        {"stdout", ""},
        {"stderr", message},
        {"exit_code", -1},
        {"execution_time", 0.0},
        {"files", nlohmann::json::array()}
    };
}

HttpServer::HttpServer(const config::ServerConfig& config, service::ExecutionService& service)
    : config_(config)
    , service_(service)
    , server_(std::make_unique<httplib::Server>()) {
    RegisterRoutes();
}

HttpServer::~HttpServer() = default;

void HttpServer::RegisterRoutes() {
    server_->set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Credentials", "true");
    });

    server_->Options(R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "*");
        res.status = 204;
    });

    server_->Post("/execute", Logged([this](const httplib::Request& req, httplib::Response& res) {
        const auto body = nlohmann::json::parse(req.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            SetJson(res, 400, ErrorBody("Invalid request", "Request body must be a JSON object"));
            return;
        }
        if (!body.contains("code") || !body["code"].is_string()) {
            SetJson(res, 400, ErrorBody("Invalid request", "Field 'code' is required and must be a string"));
            return;
        }
        core::ExecutionRequest request{};
        request.code = body["code"].get<std::string>();
        request.timeout = service_.DefaultTimeout();
        if (body.contains("timeout") && !body["timeout"].is_null()) {
            if (!body["timeout"].is_number_integer()) {
                SetJson(res, 400, ErrorBody("Invalid request", "Field 'timeout' must be an integer"));
                return;
            }
            request.timeout = ClampTimeout(body["timeout"]);
        }

        try {
            const auto result = service_.Execute(request);
            SetJson(res, 200, core::ToJson(result));
        } catch (const core::ValidationError& e) {
            auto error = ErrorBody("Validation failed", e.what());
            error["errors"] = e.Errors();
            SetJson(res, 400, error);
        } catch (const core::InfrastructureError& e) {
            auto error = ErrorBody("Execution failed", e.what());
            error["providers_tried"] = e.Tried();
            SetJson(res, 500, error);
        } catch (const core::SandboxError& e) {
            auto error = ErrorBody("Execution failed", e.what());
            error["providers_tried"] = nlohmann::json::array();
            SetJson(res, 500, error);
        } catch (const std::exception& e) {
            utils::Log(utils::LogLevel::kError, "http") << "unexpected error: " << e.what();
            SetJson(res, 500, ErrorBody("Execution failed", std::string("Unexpected error: ") + e.what()));
        }
    }));

    server_->Get("/health", Logged([this](const httplib::Request&, httplib::Response& res) {
        SetJson(res, 200, service_.Health());
    }));

    server_->Get("/", Logged([this](const httplib::Request&, httplib::Response& res) {
        SetJson(res, 200, {
            {"service", config_.app_name},
            {"version", config_.version},
            {"status", "running"},
            {"endpoints", {
                {"execute", "POST /execute"},
                {"health", "GET /health"}
            }},
            {"description", "Secure Python code execution sandbox for AI agents"}
        });
    }));
}

bool HttpServer::Listen() {
    utils::Log(utils::LogLevel::kInfo, "http")
        << config_.app_name << " v" << config_.version << " listening on " << config_.host << ":"
        << config_.port;
    return server_->listen(config_.host, config_.port);
}

int HttpServer::BindToAnyPort(const std::string& host) {
    return server_->bind_to_any_port(host);
}

bool HttpServer::ListenAfterBind() {
    return server_->listen_after_bind();
}

void HttpServer::Stop() {
    server_->stop();
}

bool HttpServer::IsRunning() const {
    return server_->is_running();
}

}  // namespace pysandbox::server
