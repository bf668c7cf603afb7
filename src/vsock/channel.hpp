#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <boost/asio/generic/stream_protocol.hpp>
#include <boost/asio/io_context.hpp>

#include "core/errors.hpp"

namespace pysandbox::vsock {

using Socket = boost::asio::generic::stream_protocol::socket;
using Duration = std::chrono::milliseconds;

// The peer closed the connection cleanly between or inside a read.
class ConnectionClosed : public core::ExecutionError {
public:
    using core::ExecutionError::ExecutionError;
};

// Length-prefixed reads and writes over one connected stream socket.
// Every operation takes its own deadline; Duration::zero() waits forever.
// A deadline that fires throws core::TimeoutError and closes the socket.
class Channel {
public:
    Channel(boost::asio::io_context& io, Socket socket);

    void Write(const std::string& bytes, Duration timeout = Duration::zero());
    std::string ReadExact(std::size_t size, Duration timeout = Duration::zero());
    // Reads up to and including '\n', returned without it.
    std::string ReadLine(std::size_t max_size, Duration timeout = Duration::zero());

    void WriteFrame(const std::string& payload, Duration timeout = Duration::zero());
    std::uint32_t ReadLength(Duration timeout = Duration::zero());
    std::string ReadFrame(Duration timeout = Duration::zero());
    // Consumes and drops `size` bytes so later frames stay aligned.
    void Discard(std::size_t size, Duration timeout = Duration::zero());

    bool IsOpen() const { return socket_.is_open(); }
    void Close();

private:
    template <typename Start>
    void Run(Start start, Duration timeout, const char* what);

    boost::asio::io_context& io_;
    Socket socket_;
};

// Host end of a Firecracker vsock device: connects to the device's Unix
// socket and performs the "CONNECT <port>" handshake.
std::unique_ptr<Channel> ConnectThroughMultiplexer(boost::asio::io_context& io,
                                                   const std::string& uds_path,
                                                   int port,
                                                   Duration timeout);

}  // namespace pysandbox::vsock
