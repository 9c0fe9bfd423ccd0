#include "sdcp/discovery/DatagramChannel.hpp"

#include "sdcp/log/Log.hpp"

namespace sdcp::discovery {

namespace {
constexpr milliseconds SEND_TIMEOUT{1000};
}

UdpDatagramChannel::UdpDatagramChannel(net::asio::io_context& io, std::size_t bufferSize)
: socket_(io)
, buffer_(bufferSize == 0 ? config::SDCP_DATAGRAM_BUFFER_SIZE : bufferSize)
{}

error_code UdpDatagramChannel::open() {
    if (auto ec = socket_.open_v4(); ec) {
        logError("[Discovery] socket open failed: ", ec.message(), "\n");
        return ec;
    }
    if (auto ec = socket_.bind_any(0); ec) {
        logError("[Discovery] bind failed: ", ec.message(), "\n");
        return ec;
    }
    return {};
}

error_code UdpDatagramChannel::send(std::string_view payload,
                                    const std::string& address,
                                    unsigned short port,
                                    bool broadcast) {
    boost::system::error_code parseError;
    const auto target = net::asio::ip::make_address_v4(address, parseError);
    if (parseError) {
        logError("[Discovery] invalid address '", address, "': ", parseError.message(), "\n");
        return parseError;
    }
    if (broadcast && !broadcastEnabled_) {
        if (auto ec = socket_.enable_broadcast(); ec) {
            return ec;
        }
        broadcastEnabled_ = true;
    }
    return socket_.send_to(payload.data(), payload.size(),
                           net::udp::endpoint(target, port), SEND_TIMEOUT);
}

expected<Datagram> UdpDatagramChannel::receive(milliseconds timeout) {
    net::udp::endpoint from;
    std::size_t n = 0;
    if (auto ec = socket_.recv_from(buffer_.data(), buffer_.size(), from, n, timeout); ec) {
        return unexpected(ec);
    }
    Datagram datagram;
    datagram.payload.assign(buffer_.data(), n);
    datagram.sender = from.address().to_string();
    datagram.port = from.port();
    return datagram;
}

} // namespace sdcp::discovery
