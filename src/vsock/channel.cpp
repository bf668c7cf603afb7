#include "vsock/channel.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <utility>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

#include "vsock/frame_codec.hpp"

namespace pysandbox::vsock {
namespace {

constexpr std::size_t kDiscardChunk = 64 * 1024;

}  // namespace

Channel::Channel(boost::asio::io_context& io, Socket socket)
    : io_(io)
    , socket_(std::move(socket)) {}

template <typename Start>
void Channel::Run(Start start, Duration timeout, const char* what) {
    boost::system::error_code result = boost::asio::error::would_block;
    start([&result](const boost::system::error_code& ec, std::size_t) { result = ec; });

    io_.restart();
    if (timeout == Duration::zero()) {
        io_.run();
    } else {
        io_.run_for(timeout);
    }

    if (result == boost::asio::error::would_block) {
        boost::system::error_code ignored;
        socket_.cancel(ignored);
        io_.restart();
        io_.run();
        Close();
        throw core::TimeoutError(std::string(what) + " timed out after " +
                                 std::to_string(timeout.count()) + " ms");
    }
    if (result == boost::asio::error::eof) {
        throw ConnectionClosed(std::string(what) + ": connection closed by peer");
    }
    if (result) {
        throw core::ExecutionError(std::string(what) + ": " + result.message());
    }
}

void Channel::Write(const std::string& bytes, Duration timeout) {
    Run([&](auto handler) {
            boost::asio::async_write(socket_, boost::asio::buffer(bytes), handler);
        },
        timeout, "write");
}

std::string Channel::ReadExact(std::size_t size, Duration timeout) {
    std::string data(size, '\0');
    if (size == 0) {
        return data;
    }
    Run([&](auto handler) {
            boost::asio::async_read(socket_, boost::asio::buffer(&data[0], size), handler);
        },
        timeout, "read");
    return data;
}

std::string Channel::ReadLine(std::size_t max_size, Duration timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string line;
    while (line.size() < max_size) {
        auto remaining = Duration::zero();
        if (timeout != Duration::zero()) {
            remaining = std::chrono::duration_cast<Duration>(deadline - std::chrono::steady_clock::now());
            if (remaining <= Duration::zero()) {
                Close();
                throw core::TimeoutError("read line timed out");
            }
        }
        const auto byte = ReadExact(1, remaining);
        if (byte[0] == '\n') {
            return line;
        }
        line += byte;
    }
    throw core::ExecutionError("line exceeds " + std::to_string(max_size) + " bytes");
}

void Channel::WriteFrame(const std::string& payload, Duration timeout) {
    Write(EncodeFrame(payload), timeout);
}

std::uint32_t Channel::ReadLength(Duration timeout) {
    const auto header = ReadExact(kHeaderSize, timeout);
    return DecodeLength(header.data());
}

std::string Channel::ReadFrame(Duration timeout) {
    const auto length = ReadLength(timeout);
    if (length > kMaxFrameSize) {
        throw core::ExecutionError("frame too large: " + std::to_string(length) + " bytes");
    }
    return ReadExact(length, timeout);
}

void Channel::Discard(std::size_t size, Duration timeout) {
    while (size > 0) {
        const auto chunk = std::min(size, kDiscardChunk);
        ReadExact(chunk, timeout);
        size -= chunk;
    }
}

void Channel::Close() {
    boost::system::error_code ignored;
    socket_.shutdown(boost::asio::socket_base::shutdown_both, ignored);
    socket_.close(ignored);
}

std::unique_ptr<Channel> ConnectThroughMultiplexer(boost::asio::io_context& io,
                                                   const std::string& uds_path,
                                                   int port,
                                                   Duration timeout) {
    const boost::asio::local::stream_protocol::endpoint local(uds_path);
    const boost::asio::generic::stream_protocol::endpoint endpoint(local);
    Socket socket(io, boost::asio::generic::stream_protocol(AF_UNIX, 0));

    boost::system::error_code ec;
    socket.connect(endpoint, ec);
    if (ec) {
        throw core::ExecutionError("connect " + uds_path + ": " + ec.message());
    }

    auto channel = std::make_unique<Channel>(io, std::move(socket));
    channel->Write("CONNECT " + std::to_string(port) + "\n", timeout);
    const auto reply = channel->ReadLine(64, timeout);
    if (reply.rfind("OK ", 0) != 0) {
        throw core::ExecutionError("vsock handshake rejected: " + reply);
    }
    return channel;
}

}  // namespace pysandbox::vsock
