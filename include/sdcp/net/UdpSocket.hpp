#pragma once
#include "sdcp/net/NetConfig.hpp"
#include "sdcp/net/Deadline.hpp"

#include <cstdint>

namespace sdcp::net {

/**
 * UdpSocket
 *
 * Small helper for datagram use-cases like device discovery.
 *
 * - `send_to` / `recv_from` block with a deadline using `with_deadline`.
 * - Only one operation is in flight at a time; the socket is not meant to be
 *   shared between threads.
 * - Enable broadcast before sending to a broadcast address.
 */
class UdpSocket {
public:
    explicit UdpSocket(asio::io_context& io) : sock_(io) {}

    ~UdpSocket() { close(); }

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    error_code open_v4() {
        boost::system::error_code ec;
        sock_.open(udp::v4(), ec);
        return ec;
    }

    // Port 0 binds an ephemeral port.
    error_code bind_any(std::uint16_t port) {
        boost::system::error_code ec;
        sock_.bind(udp::endpoint(udp::v4(), port), ec);
        return ec;
    }

    error_code enable_broadcast(bool on = true) {
        boost::system::error_code ec;
        sock_.set_option(asio::socket_base::broadcast(on), ec);
        return ec;
    }

    error_code send_to(const void* data, std::size_t n,
                       const udp::endpoint& ep, milliseconds timeout) {
        return with_deadline(sock_.get_executor(), timeout,
            [this, data, n, ep](auto cb){ sock_.async_send_to(asio::buffer(data, n), ep, 0, cb); },
            [this]{ boost::system::error_code ignore; sock_.cancel(ignore); });
    }

    // Receive one datagram, with timeout. Fills out_ep and out_n on success.
    error_code recv_from(void* data, std::size_t max,
                         udp::endpoint& out_ep, std::size_t& out_n,
                         milliseconds timeout) {
        out_n = 0;
        return with_deadline(sock_.get_executor(), timeout,
            [&, data, max](auto cb){
                sock_.async_receive_from(asio::buffer(data, max), out_ep, 0,
                    [&out_n, cb](const boost::system::error_code& ec, std::size_t n) mutable {
                        out_n = n;
                        cb(ec);
                    });
            },
            [this]{ boost::system::error_code ignore; sock_.cancel(ignore); });
    }

    std::uint16_t local_port() const {
        boost::system::error_code ec;
        auto ep = sock_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    udp::socket& raw() { return sock_; }
    void close() { boost::system::error_code ignore; sock_.close(ignore); }

private:
    udp::socket sock_;
};

} // namespace sdcp::net
