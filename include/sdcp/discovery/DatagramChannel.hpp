#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/net/NetConfig.hpp"
#include "sdcp/net/UdpSocket.hpp"
#include "sdcp/protocol/SdcpConfig.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace sdcp::discovery {

using net::error_code;
using net::milliseconds;

struct Datagram {
    std::string payload;
    std::string sender;   ///< dotted address of the peer
    unsigned short port = 0;
};

/**
 * @brief Unreliable datagram transport used by discovery.
 *
 * The UDP implementation below is what applications use; tests substitute an
 * in-memory network.
 */
class DatagramChannel {
public:
    virtual ~DatagramChannel() = default;

    virtual error_code send(std::string_view payload,
                            const std::string& address,
                            unsigned short port,
                            bool broadcast) = 0;

    /// Next datagram; `net::timed_out()` when none arrived in time.
    virtual expected<Datagram> receive(milliseconds timeout) = 0;

    virtual void close() = 0;
};

/**
 * @brief DatagramChannel over a UdpSocket bound to an ephemeral port.
 *
 * The io_context must be running (see net::NetService) and must outlive the
 * channel.
 */
class UdpDatagramChannel : public DatagramChannel {
public:
    explicit UdpDatagramChannel(net::asio::io_context& io,
                                std::size_t bufferSize = config::SDCP_DATAGRAM_BUFFER_SIZE);

    /// Open and bind; must succeed before send/receive.
    error_code open();

    error_code send(std::string_view payload,
                    const std::string& address,
                    unsigned short port,
                    bool broadcast) override;
    expected<Datagram> receive(milliseconds timeout) override;
    void close() override { socket_.close(); }

    std::uint16_t localPort() const { return socket_.local_port(); }

private:
    net::UdpSocket socket_;
    std::vector<char> buffer_;
    bool broadcastEnabled_ = false;
};

} // namespace sdcp::discovery
