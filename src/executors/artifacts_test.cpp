#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "executors/artifacts.hpp"

namespace pysandbox::executors {
namespace {

using Decision = ArtifactCollector::Decision;

class RecordingStorage : public storage::Storage {
public:
    std::optional<std::string> Save(const std::string& content,
                                    const std::string& filename,
                                    const std::string& execution_id,
                                    const storage::Metadata& metadata) override {
        if (filename == fail_on) {
            throw std::runtime_error("bucket unavailable");
        }
        saved.push_back(filename + "=" + content);
        last_metadata = metadata;
        return "executions/" + execution_id + "/" + filename;
    }

    std::string GenerateTemporaryUrl(const std::string& location, int ttl_s) override {
        return "https://files.example/" + location + "?ttl=" + std::to_string(ttl_s);
    }

    bool HealthCheck() override { return true; }
    bool IsEnabled() const override { return enabled; }
    std::string Name() const override { return "recording"; }

    bool enabled = true;
    std::string fail_on;
    std::vector<std::string> saved;
    storage::Metadata last_metadata;
};

FileLimits SmallLimits() {
    FileLimits limits{};
    limits.max_file_size = 100;
    limits.max_total_size = 150;
    limits.max_file_count = 3;
    return limits;
}

TEST(TruncateOutputTest, LeavesShortTextAlone) {
    EXPECT_EQ(TruncateOutput("hello", 5), "hello");
    EXPECT_EQ(TruncateOutput("", 0), "");
}

TEST(TruncateOutputTest, AppendsMarkerPastLimit) {
    const std::string text(20, 'a');
    EXPECT_EQ(TruncateOutput(text, 8),
              std::string(8, 'a') + "\n\n[Output truncated - exceeded 8 bytes]");
}

TEST(TruncateOutputTest, NeverSplitsACodePoint) {
    // "a" followed by two-byte "é"; a cut at 2 would land inside it.
    const std::string text = "a\xc3\xa9z";
    EXPECT_EQ(TruncateOutput(text, 2), "a\n\n[Output truncated - exceeded 2 bytes]");
}

TEST(LooksLikeTimeoutTest, MatchesEitherSpelling) {
    EXPECT_TRUE(LooksLikeTimeout("Read Timeout"));
    EXPECT_TRUE(LooksLikeTimeout("operation TIMED OUT"));
    EXPECT_FALSE(LooksLikeTimeout("connection refused"));
}

TEST(FileLimitsTest, CopiesConfiguredCeilings) {
    config::LimitsConfig config{};
    config.max_file_size = 1;
    config.max_total_size = 2;
    config.max_file_count = 3;
    const auto limits = FileLimits::FromConfig(config);
    EXPECT_EQ(limits.max_file_size, 1u);
    EXPECT_EQ(limits.max_total_size, 2u);
    EXPECT_EQ(limits.max_file_count, 3u);
}

TEST(ArtifactCollectorTest, SkipsHiddenEmptyAndOversizeFiles) {
    ArtifactCollector collector(std::make_shared<RecordingStorage>(), SmallLimits(), 60, "x", "test");
    EXPECT_EQ(collector.Admit(".cache", 10), Decision::kSkip);
    EXPECT_EQ(collector.Admit("", 10), Decision::kSkip);
    EXPECT_EQ(collector.Admit("empty.txt", 0), Decision::kSkip);
    EXPECT_EQ(collector.Admit("huge.bin", 101), Decision::kSkip);
    EXPECT_EQ(collector.Admit("ok.txt", 100), Decision::kAccept);
}

TEST(ArtifactCollectorTest, StopsAtTotalSize) {
    ArtifactCollector collector(std::make_shared<RecordingStorage>(), SmallLimits(), 60, "x", "test");
    EXPECT_EQ(collector.Admit("a.txt", 100), Decision::kAccept);
    EXPECT_EQ(collector.Admit("b.txt", 51), Decision::kStop);
    EXPECT_EQ(collector.Admit("c.txt", 50), Decision::kAccept);
}

TEST(ArtifactCollectorTest, StopsAtFileCount) {
    ArtifactCollector collector(std::make_shared<RecordingStorage>(), SmallLimits(), 60, "x", "test");
    int accepted = 0;
    for (int i = 0; i < 6; ++i) {
        const auto decision = collector.Admit("f" + std::to_string(i), 1);
        if (decision == Decision::kStop) {
            break;
        }
        if (decision == Decision::kAccept) {
            ++accepted;
        }
    }
    EXPECT_EQ(accepted, 3);
}

TEST(ArtifactCollectorTest, StoresAndCollectsUrls) {
    auto storage = std::make_shared<RecordingStorage>();
    ArtifactCollector collector(storage, SmallLimits(), 300, "exec-1", "test");
    ASSERT_TRUE(collector.Enabled());

    collector.Store("plot.png", "PNG", "/tmp/output/plot.png");
    ASSERT_EQ(collector.Urls().size(), 1u);
    EXPECT_EQ(collector.Urls()[0], "https://files.example/executions/exec-1/plot.png?ttl=300");
    EXPECT_EQ(storage->saved, std::vector<std::string>{"plot.png=PNG"});
    EXPECT_EQ(storage->last_metadata.at("size"), "3");
    EXPECT_EQ(storage->last_metadata.at("original_path"), "/tmp/output/plot.png");
}

TEST(ArtifactCollectorTest, StorageFailureDropsOnlyThatFile) {
    auto storage = std::make_shared<RecordingStorage>();
    storage->fail_on = "bad.txt";
    ArtifactCollector collector(storage, SmallLimits(), 60, "exec-2", "test");

    EXPECT_NO_THROW(collector.Store("bad.txt", "x", "/tmp/output/bad.txt"));
    collector.Store("good.txt", "y", "/tmp/output/good.txt");
    ASSERT_EQ(collector.Urls().size(), 1u);
    EXPECT_NE(collector.Urls()[0].find("good.txt"), std::string::npos);
}

TEST(ArtifactCollectorTest, DisabledWithoutStorage) {
    ArtifactCollector without(nullptr, SmallLimits(), 60, "x", "test");
    EXPECT_FALSE(without.Enabled());
    without.Store("a.txt", "data", "/tmp/output/a.txt");
    EXPECT_TRUE(without.Urls().empty());

    auto storage = std::make_shared<RecordingStorage>();
    storage->enabled = false;
    ArtifactCollector disabled(storage, SmallLimits(), 60, "x", "test");
    EXPECT_FALSE(disabled.Enabled());
    disabled.Store("a.txt", "data", "/tmp/output/a.txt");
    EXPECT_TRUE(storage->saved.empty());
}

}  // namespace
}  // namespace pysandbox::executors
