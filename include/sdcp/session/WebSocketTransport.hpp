#pragma once

#include "sdcp/session/MessageTransport.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace sdcp::session {

/**
 * @brief MessageTransport over a Boost.Beast WebSocket client stream.
 *
 * Every stream operation runs on a strand of the shared io_context. After the
 * handshake a read loop stays pending and fills an inbox that `receive`
 * drains, so the reader thread never touches the socket itself.
 *
 * A protocol-level pong is surfaced as the text "pong" so the session treats
 * both keepalive styles the same. Pings from the printer are answered by
 * Beast.
 *
 * Lifetime notes:
 * - The io_context must be running for as long as the transport exists.
 * - The destructor closes the socket and waits for the read loop to finish,
 *   so it must not run on the io_context's own thread.
 */
class WebSocketTransport : public MessageTransport {
public:
    explicit WebSocketTransport(net::asio::io_context& io,
                                std::size_t maxMessageSize = config::SDCP_MAX_MESSAGE_SIZE);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    /// Resolve, connect and upgrade. A refused or malformed upgrade
    /// (including a wrong Sec-WebSocket-Accept) is `errc::protocol_mismatch`.
    error_code connect(const Endpoint& endpoint, std::chrono::milliseconds timeout) override;
    error_code send(std::string_view text, std::chrono::milliseconds timeout) override;
    expected<std::string> receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    using Strand = net::asio::strand<net::asio::io_context::executor_type>;
    using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    // Strand only.
    void startRead();
    void push(std::string message);

    Strand strand_;
    net::tcp::resolver resolver_;
    Stream ws_;
    boost::beast::flat_buffer buffer_;
    std::size_t maxMessageSize_;
    std::string host_;
    std::string path_;

    std::mutex writeMutex_;   // one async_write in flight

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> inbox_;
    error_code readError_;
    std::size_t outstanding_ = 0;   // handlers that still reference *this
    std::atomic<bool> closed_{false};
};

/// Factory for WebSocket transports bound to @p io (which must outlive them).
TransportFactory webSocketTransportFactory(net::asio::io_context& io);

} // namespace sdcp::session
