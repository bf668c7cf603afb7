#include <gtest/gtest.h>

#include <archive.h>
#include <archive_entry.h>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/types.hpp"
#include "executors/docker/docker_executor.hpp"
#include "httplib.h"
#include "utils/common.hpp"

namespace pysandbox::executors::docker {
namespace {

class MemoryStorage : public storage::Storage {
public:
    std::optional<std::string> Save(const std::string& content,
                                    const std::string& filename,
                                    const std::string& execution_id,
                                    const storage::Metadata& metadata) override {
        files.emplace_back(filename, content);
        paths.push_back(metadata.at("original_path"));
        return execution_id + "/" + filename;
    }
    std::string GenerateTemporaryUrl(const std::string& location, int) override {
        return "mem://" + location;
    }
    bool HealthCheck() override { return true; }
    bool IsEnabled() const override { return true; }
    std::string Name() const override { return "memory"; }

    std::vector<std::pair<std::string, std::string>> files;
    std::vector<std::string> paths;
};

struct TarEntry {
    std::string path;
    std::string content;
    bool directory = false;
};

std::string WriteTar(const std::vector<TarEntry>& entries) {
    std::vector<char> buffer(1 << 20);
    std::size_t used = 0;
    struct archive* writer = archive_write_new();
    archive_write_set_format_pax_restricted(writer);
    archive_write_open_memory(writer, buffer.data(), buffer.size(), &used);
    for (const auto& item : entries) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, item.path.c_str());
        if (item.directory) {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            archive_entry_set_size(entry, 0);
        } else {
            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, 0644);
            archive_entry_set_size(entry, static_cast<la_int64_t>(item.content.size()));
        }
        archive_write_header(writer, entry);
        if (!item.directory && !item.content.empty()) {
            archive_write_data(writer, item.content.data(), item.content.size());
        }
        archive_entry_free(entry);
    }
    archive_write_close(writer);
    archive_write_free(writer);
    return std::string(buffer.data(), used);
}

FileLimits Limits(std::size_t count) {
    FileLimits limits{};
    limits.max_file_size = 64;
    limits.max_total_size = 1024;
    limits.max_file_count = count;
    return limits;
}

// One 8-byte multiplexed log header followed by its payload.
std::string Frame(char stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = stream;
    const auto size = static_cast<std::uint32_t>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xFF);
    frame[5] = static_cast<char>((size >> 16) & 0xFF);
    frame[6] = static_cast<char>((size >> 8) & 0xFF);
    frame[7] = static_cast<char>(size & 0xFF);
    return frame + payload;
}

// Answers the Engine API routes the executor uses on a Unix socket and
// records container creation and removal.
class FakeEngine {
public:
    static constexpr const char* kContainerId = "c0ffee0123456789";

    FakeEngine()
        : path_((std::filesystem::temp_directory_path() / ("pysandbox_engine_" + utils::NewId() + ".sock"))
                    .string()) {
        server_.set_address_family(AF_UNIX);
        server_.Get("/_ping", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content("OK", "text/plain");
        });
        server_.Get(R"(/images/.+/json)", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
            res.set_content("{}", "application/json");
        });
        server_.Post("/containers/create", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++creates_;
            res.status = create_status_;
            res.set_content(create_status_ == 201 ? std::string(R"({"Id":")") + kContainerId + "\"}"
                                                  : std::string(R"({"message":"no space left on device"})"),
                            "application/json");
        });
        server_.Post(R"(/containers/([^/]+)/start)", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            res.status = start_status_;
            if (start_status_ != 204) {
                res.set_content(R"({"message":"cannot start container"})", "application/json");
            }
        });
        server_.Post(R"(/containers/([^/]+)/wait)", [this](const httplib::Request&, httplib::Response& res) {
            if (hang_wait_) {
                for (int i = 0; i < 300 && !stopping_; ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            res.status = 200;
            res.set_content(nlohmann::json{{"StatusCode", exit_status_}}.dump(), "application/json");
        });
        server_.Get(R"(/containers/([^/]+)/logs)", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::string body;
            if (req.get_param_value("stdout") == "1") {
                body += Frame(1, stdout_);
            }
            if (req.get_param_value("stderr") == "1") {
                body += Frame(2, stderr_);
            }
            res.status = 200;
            res.set_content(body, "application/octet-stream");
        });
        server_.Get(R"(/containers/([^/]+)/archive)", [this](const httplib::Request&, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++archive_requests_;
            if (!archive_) {
                res.status = 404;
                return;
            }
            res.status = 200;
            res.set_content(*archive_, "application/x-tar");
        });
        server_.Delete(R"(/containers/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lock(mutex_);
            removed_.push_back(req.matches[1].str() + (req.get_param_value("force") == "1" ? " force" : ""));
            res.status = 204;
        });
        thread_ = std::thread([this]() { server_.listen(path_, 80); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    ~FakeEngine() {
        stopping_ = true;
        server_.stop();
        thread_.join();
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void SetExit(int status, std::string out, std::string err) {
        std::lock_guard<std::mutex> lock(mutex_);
        exit_status_ = status;
        stdout_ = std::move(out);
        stderr_ = std::move(err);
    }
    void SetArchive(std::string tar) {
        std::lock_guard<std::mutex> lock(mutex_);
        archive_ = std::move(tar);
    }
    void SetCreateStatus(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        create_status_ = status;
    }
    void SetStartStatus(int status) {
        std::lock_guard<std::mutex> lock(mutex_);
        start_status_ = status;
    }
    void HangOnWait() { hang_wait_ = true; }

    int Creates() {
        std::lock_guard<std::mutex> lock(mutex_);
        return creates_;
    }
    int ArchiveRequests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return archive_requests_;
    }
    std::vector<std::string> Removed() {
        std::lock_guard<std::mutex> lock(mutex_);
        return removed_;
    }

    const std::string& Path() const { return path_; }

private:
    std::string path_;
    httplib::Server server_;
    std::thread thread_;
    std::mutex mutex_;
    std::atomic<bool> stopping_{false};
    std::atomic<bool> hang_wait_{false};
    int create_status_ = 201;
    int start_status_ = 204;
    int exit_status_ = 0;
    std::string stdout_;
    std::string stderr_;
    std::optional<std::string> archive_;
    int creates_ = 0;
    int archive_requests_ = 0;
    std::vector<std::string> removed_;
};

class DockerExecuteTest : public ::testing::Test {
protected:
    void SetUp() override {
        docker_.socket = engine_.Path();
        limits_.output_dir = "/tmp/output";
    }

    std::unique_ptr<DockerExecutor> MakeExecutor(std::shared_ptr<storage::Storage> storage = nullptr) {
        return std::make_unique<DockerExecutor>(docker_, limits_, std::move(storage));
    }

    const std::vector<std::string> removed_once_{std::string(FakeEngine::kContainerId) + " force"};

    FakeEngine engine_;
    config::DockerConfig docker_;
    config::LimitsConfig limits_;
};

TEST(ParseMemorySizeTest, AcceptsSuffixes) {
    EXPECT_EQ(ParseMemorySize("128m"), 134217728);
    EXPECT_EQ(ParseMemorySize("1G"), 1073741824);
    EXPECT_EQ(ParseMemorySize("512k"), 524288);
    EXPECT_EQ(ParseMemorySize("100b"), 100);
    EXPECT_EQ(ParseMemorySize(" 2048 "), 2048);
}

TEST(ParseMemorySizeTest, RejectsGarbage) {
    EXPECT_THROW(ParseMemorySize(""), std::invalid_argument);
    EXPECT_THROW(ParseMemorySize("m"), std::invalid_argument);
    EXPECT_THROW(ParseMemorySize("12x"), std::invalid_argument);
    EXPECT_THROW(ParseMemorySize("-5m"), std::invalid_argument);
}

TEST(BuildContainerSpecTest, LocksDownTheContainer) {
    config::DockerConfig config{};
    config.image = "python-sandbox:test";
    const auto spec = BuildContainerSpec(config, "print(1)");

    EXPECT_EQ(spec["Image"], "python-sandbox:test");
    EXPECT_EQ(spec["Cmd"], nlohmann::json::array({"python", "-c", "print(1)"}));
    EXPECT_EQ(spec["NetworkDisabled"], true);

    const auto& host = spec["HostConfig"];
    EXPECT_EQ(host["Memory"], 134217728);
    EXPECT_EQ(host["MemorySwap"], 134217728);
    EXPECT_EQ(host["CpuQuota"], 50000);
    EXPECT_EQ(host["CpuPeriod"], 100000);
    EXPECT_EQ(host["PidsLimit"], 50);
    EXPECT_EQ(host["NetworkMode"], "none");
    EXPECT_EQ(host["SecurityOpt"], nlohmann::json::array({"no-new-privileges"}));
    EXPECT_EQ(host["CapDrop"], nlohmann::json::array({"ALL"}));
}

TEST(CollectFromTarTest, StoresRegularFilesByBaseName) {
    const auto tar = WriteTar({
        {"output", "", true},
        {"output/result.csv", "a,b\n1,2\n"},
        {"output/.hidden", "secret"},
        {"output/empty.txt", ""},
        {"output/large.bin", std::string(65, 'x')},
        {"output/nested", "", true},
        {"output/nested/chart.svg", "<svg/>"}
    });

    auto storage = std::make_shared<MemoryStorage>();
    ArtifactCollector collector(storage, Limits(10), 60, "exec", "test");
    CollectFromTar(tar, collector);

    ASSERT_EQ(storage->files.size(), 2u);
    EXPECT_EQ(storage->files[0], std::make_pair(std::string("result.csv"), std::string("a,b\n1,2\n")));
    EXPECT_EQ(storage->files[1], std::make_pair(std::string("chart.svg"), std::string("<svg/>")));
    EXPECT_EQ(storage->paths[0], "output/result.csv");
    EXPECT_EQ(collector.Urls(), (std::vector<std::string>{"mem://exec/result.csv", "mem://exec/chart.svg"}));
}

TEST(CollectFromTarTest, StopsAtFileCount) {
    std::vector<TarEntry> entries;
    for (int i = 0; i < 13; ++i) {
        entries.push_back({"output/file" + std::to_string(i) + ".txt", "data"});
    }
    auto storage = std::make_shared<MemoryStorage>();
    ArtifactCollector collector(storage, Limits(10), 60, "exec", "test");
    CollectFromTar(WriteTar(entries), collector);
    EXPECT_EQ(storage->files.size(), 10u);
}

TEST(CollectFromTarTest, RejectsNonArchive) {
    auto storage = std::make_shared<MemoryStorage>();
    ArtifactCollector collector(storage, Limits(10), 60, "exec", "test");
    EXPECT_THROW(CollectFromTar(std::string(1024, 'z'), collector), core::ExecutionError);
    EXPECT_TRUE(storage->files.empty());
}

TEST(DockerExecutorTest, ConstructionFailsWithoutEngine) {
    config::DockerConfig docker{};
    docker.socket = "/nonexistent/docker.sock";
    try {
        DockerExecutor executor(docker, config::LimitsConfig{}, nullptr);
        FAIL() << "expected ExecutionError";
    } catch (const core::ExecutionError& e) {
        EXPECT_EQ(std::string(e.what()),
                  "Failed to initialize Docker client: no engine answering on /nonexistent/docker.sock");
    }
}

TEST_F(DockerExecuteTest, ReturnsOutputAndFiles) {
    engine_.SetExit(0, "hello\n", "");
    engine_.SetArchive(WriteTar({{"output", "", true}, {"output/result.csv", "a,b\n"}}));
    auto storage = std::make_shared<MemoryStorage>();
    auto executor = MakeExecutor(storage);

    const auto result = executor->Execute("print('hello')", 5);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_FALSE(result.error.has_value());
    ASSERT_EQ(result.files.size(), 1u);
    EXPECT_EQ(result.files[0].substr(0, 6), "mem://");
    EXPECT_EQ(storage->files, (std::vector<std::pair<std::string, std::string>>{{"result.csv", "a,b\n"}}));
    EXPECT_EQ(engine_.Removed(), removed_once_);
}

TEST_F(DockerExecuteTest, TruncatesLongOutput) {
    limits_.max_output_size = 16;
    engine_.SetExit(0, std::string(40, 'x'), std::string(20, 'e'));
    auto executor = MakeExecutor();

    const auto result = executor->Execute("print('x' * 40)", 5);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.stdout_text, std::string(16, 'x') + "\n\n[Output truncated - exceeded 16 bytes]");
    EXPECT_EQ(result.stderr_text, std::string(16, 'e') + "\n\n[Output truncated - exceeded 16 bytes]");
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(engine_.ArchiveRequests(), 0);
    EXPECT_EQ(engine_.Removed(), removed_once_);
}

TEST_F(DockerExecuteTest, NonZeroExitIsAContainerError) {
    engine_.SetExit(1, "partial\n", "NameError: name 'x' is not defined\n");
    engine_.SetArchive(WriteTar({{"output/result.csv", "a,b\n"}}));
    auto storage = std::make_shared<MemoryStorage>();
    auto executor = MakeExecutor(storage);

    const auto result = executor->Execute("print('partial')\nx", 5);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Container error");
    EXPECT_EQ(result.stdout_text, "");
    EXPECT_EQ(result.stderr_text, "NameError: name 'x' is not defined\n");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.files.empty());
    EXPECT_EQ(engine_.ArchiveRequests(), 0);
    EXPECT_TRUE(storage->files.empty());
    EXPECT_EQ(engine_.Removed(), removed_once_);
}

TEST_F(DockerExecuteTest, WaitDeadlineIsATimeout) {
    engine_.HangOnWait();
    auto executor = MakeExecutor();

    const auto begin = std::chrono::steady_clock::now();
    const auto result = executor->Execute("while True: pass", 1);

    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(5));
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Execution timeout");
    EXPECT_EQ(result.stderr_text, "Execution timeout after 1 seconds");
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(engine_.Removed(), removed_once_);
}

TEST_F(DockerExecuteTest, StartFailureStillRemovesContainer) {
    engine_.SetStartStatus(500);
    auto executor = MakeExecutor();

    const auto result = executor->Execute("print(1)", 5);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Execution failed");
    EXPECT_EQ(result.stderr_text, "container start failed: cannot start container");
    EXPECT_EQ(result.exit_code, -1);
    EXPECT_EQ(engine_.Removed(), removed_once_);
}

TEST_F(DockerExecuteTest, CreateFailureRemovesNothing) {
    engine_.SetCreateStatus(500);
    auto executor = MakeExecutor();

    const auto result = executor->Execute("print(1)", 5);

    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Execution failed");
    EXPECT_EQ(result.stderr_text, "container create failed: no space left on device");
    EXPECT_EQ(engine_.Creates(), 1);
    EXPECT_TRUE(engine_.Removed().empty());
}

}  // namespace
}  // namespace pysandbox::executors::docker
