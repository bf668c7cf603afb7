#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "executors/executor_factory.hpp"
#include "executors/executor_registry.hpp"
#include "httplib.h"
#include "server/http_server.hpp"
#include "service/execution_service.hpp"

namespace pysandbox::server {
namespace {

class StubExecutor : public executors::Executor {
public:
    core::ExecutionResult Execute(const std::string& code, int timeout_s) override {
        core::ExecutionResult result{};
        result.success = true;
        result.exit_code = 0;
        result.stdout_text = "ran " + std::to_string(code.size()) + " bytes";
        result.execution_time = 0.25;
        result.files = {"https://files.example.com/plot.png"};
        last_timeout = timeout_s;
        return result;
    }
    bool HealthCheck() override { return true; }
    void Cleanup() override {}
    std::string Name() const override { return "stub"; }

    int last_timeout = 0;
};

class HttpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<StubExecutor>();
        registry_.Register("stub", [this]() {
            return std::unique_ptr<executors::Executor>(std::make_unique<Forwarder>(executor_));
        });
        config_.executor.provider = "stub";
        config_.executor.fallback_providers = "";
        factory_ = std::make_unique<executors::ExecutorFactory>(registry_, config_.executor);
        service_ = std::make_unique<service::ExecutionService>(config_, *factory_, nullptr);
        server_ = std::make_unique<HttpServer>(config_.server, *service_);

        port_ = server_->BindToAnyPort("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_->ListenAfterBind(); });
        for (int i = 0; i < 200 && !server_->IsRunning(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_->Stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    httplib::Result Post(const std::string& body) {
        httplib::Client client("127.0.0.1", port_);
        return client.Post("/execute", body, "application/json");
    }

    // The registry hands out fresh instances; this one forwards to the shared stub.
    class Forwarder : public executors::Executor {
    public:
        explicit Forwarder(std::shared_ptr<StubExecutor> target)
            : target_(std::move(target)) {}
        core::ExecutionResult Execute(const std::string& code, int timeout_s) override {
            return target_->Execute(code, timeout_s);
        }
        bool HealthCheck() override { return target_->HealthCheck(); }
        void Cleanup() override {}
        std::string Name() const override { return target_->Name(); }

    private:
        std::shared_ptr<StubExecutor> target_;
    };

    std::shared_ptr<StubExecutor> executor_;
    config::Config config_;
    executors::ExecutorRegistry registry_;
    std::unique_ptr<executors::ExecutorFactory> factory_;
    std::unique_ptr<service::ExecutionService> service_;
    std::unique_ptr<HttpServer> server_;
    std::thread thread_;
    int port_ = -1;
};

TEST(ErrorBodyTest, MirrorsExecutionResult) {
    const auto body = ErrorBody("Invalid request", "bad");
    EXPECT_EQ(body["success"], false);
    EXPECT_EQ(body["error"], "Invalid request");
    EXPECT_EQ(body["stderr"], "bad");
    EXPECT_EQ(body["exit_code"], -1);
    EXPECT_TRUE(body["files"].empty());
}

TEST_F(HttpServerTest, ServesIndexAndHealth) {
    httplib::Client client("127.0.0.1", port_);
    const auto index = client.Get("/");
    ASSERT_TRUE(index);
    EXPECT_EQ(index->status, 200);
    const auto info = nlohmann::json::parse(index->body);
    EXPECT_EQ(info["service"], "Python Sandbox");
    EXPECT_EQ(info["status"], "running");
    EXPECT_EQ(info["endpoints"]["execute"], "POST /execute");

    const auto health = client.Get("/health");
    ASSERT_TRUE(health);
    EXPECT_EQ(health->status, 200);
    EXPECT_EQ(nlohmann::json::parse(health->body)["status"], "healthy");
}

TEST_F(HttpServerTest, ExecutesCode) {
    const auto res = Post(R"({"code": "print(1)", "timeout": 4})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

    const auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["success"], true);
    EXPECT_EQ(body["stdout"], "ran 8 bytes");
    EXPECT_EQ(body["exit_code"], 0);
    EXPECT_EQ(body["execution_time"], 0.25);
    EXPECT_TRUE(body["error"].is_null());
    EXPECT_EQ(body["files"][0], "https://files.example.com/plot.png");
    EXPECT_EQ(executor_->last_timeout, 4);
}

TEST_F(HttpServerTest, AppliesDefaultTimeout) {
    const auto res = Post(R"({"code": "print(1)"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(executor_->last_timeout, 10);
}

TEST_F(HttpServerTest, RejectsMalformedBodies) {
    for (const auto* body : {"{not json", "[1, 2]", R"({"timeout": 3})", R"({"code": 5})",
                             R"({"code": "x", "timeout": "soon"})"}) {
        const auto res = Post(body);
        ASSERT_TRUE(res) << body;
        EXPECT_EQ(res->status, 400) << body;
        EXPECT_EQ(nlohmann::json::parse(res->body)["error"], "Invalid request") << body;
    }
}

TEST_F(HttpServerTest, ReportsValidationFailures) {
    const auto res = Post(R"({"code": "import subprocess\n", "timeout": 5})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    const auto body = nlohmann::json::parse(res->body);
    EXPECT_EQ(body["error"], "Validation failed");
    EXPECT_EQ(body["message"], "Validation failed: Forbidden import: subprocess");
    EXPECT_EQ(body["errors"][0], "Forbidden import: subprocess");

    const auto timeout = Post(R"({"code": "print(1)", "timeout": 99})");
    ASSERT_TRUE(timeout);
    EXPECT_EQ(timeout->status, 400);
    EXPECT_EQ(nlohmann::json::parse(timeout->body)["message"], "Timeout must be between 1 and 30 seconds");
}

TEST_F(HttpServerTest, RejectsTimeoutsBeyondIntRange) {
    for (const char* timeout : {"4294967306", "18446744073709551615", "-4294967286"}) {
        const auto res = Post(std::string(R"({"code": "print(1)", "timeout": )") + timeout + "}");
        ASSERT_TRUE(res) << timeout;
        EXPECT_EQ(res->status, 400) << timeout;
        EXPECT_EQ(nlohmann::json::parse(res->body)["message"], "Timeout must be between 1 and 30 seconds")
            << timeout;
    }
    EXPECT_EQ(executor_->last_timeout, 0);
}

}  // namespace
}  // namespace pysandbox::server
