#include <gtest/gtest.h>

#include <string>

#include "executors/docker/docker_client.hpp"

namespace pysandbox::executors::docker {
namespace {

std::string Frame(char stream, const std::string& payload) {
    std::string frame(8, '\0');
    frame[0] = stream;
    const auto size = static_cast<unsigned int>(payload.size());
    frame[4] = static_cast<char>((size >> 24) & 0xFF);
    frame[5] = static_cast<char>((size >> 16) & 0xFF);
    frame[6] = static_cast<char>((size >> 8) & 0xFF);
    frame[7] = static_cast<char>(size & 0xFF);
    return frame + payload;
}

TEST(DemultiplexLogsTest, SplitsStreams) {
    const auto raw = Frame(1, "hello\n") + Frame(2, "oops\n") + Frame(1, "world\n");
    const auto streams = DemultiplexLogs(raw);
    EXPECT_EQ(streams.out, "hello\nworld\n");
    EXPECT_EQ(streams.err, "oops\n");
}

TEST(DemultiplexLogsTest, HandlesLargePayloads) {
    const std::string payload(70000, 'x');
    const auto streams = DemultiplexLogs(Frame(1, payload));
    EXPECT_EQ(streams.out, payload);
    EXPECT_TRUE(streams.err.empty());
}

TEST(DemultiplexLogsTest, PassesThroughUnframedOutput) {
    const auto streams = DemultiplexLogs("plain text from a tty container");
    EXPECT_EQ(streams.out, "plain text from a tty container");
    EXPECT_TRUE(streams.err.empty());
}

TEST(DemultiplexLogsTest, EmptyInputIsEmpty) {
    const auto streams = DemultiplexLogs("");
    EXPECT_TRUE(streams.out.empty());
    EXPECT_TRUE(streams.err.empty());
}

TEST(DemultiplexLogsTest, KeepsTruncatedFinalChunk) {
    auto raw = Frame(2, "complete");
    raw.resize(raw.size() - 3);
    EXPECT_EQ(DemultiplexLogs(raw).err, "compl");
}

TEST(DockerClientTest, PingFailsWithoutDaemon) {
    DockerClient client("/nonexistent/docker.sock");
    EXPECT_EQ(client.SocketPath(), "/nonexistent/docker.sock");
    EXPECT_FALSE(client.Ping());
}

}  // namespace
}  // namespace pysandbox::executors::docker
