#include "sdcp/discovery/Discovery.hpp"

#include "sdcp/core/Error.hpp"
#include "sdcp/log/Log.hpp"
#include "sdcp/net/NetService.hpp"
#include "sdcp/protocol/WireCodec.hpp"

namespace sdcp::discovery {

namespace {

using SteadyClock = std::chrono::steady_clock;

milliseconds remainingUntil(SteadyClock::time_point deadline) {
    const auto left = std::chrono::duration_cast<milliseconds>(deadline - SteadyClock::now());
    return left.count() < 0 ? milliseconds::zero() : left;
}

} // namespace

DiscoveryScan::DiscoveryScan(std::unique_ptr<DatagramChannel> channel,
                             milliseconds window,
                             DiscoveryConfig config)
: channel_(std::move(channel))
, config_(std::move(config))
, deadline_(SteadyClock::now() + window)
{
    error_ = channel_->send(config::SDCP_DISCOVERY_PROBE, config_.address, config_.port, true);
    if (error_) {
        logError("[Discovery] probe to ", config_.address, ":", config_.port,
                 " failed: ", error_.message(), "\n");
        finish();
        return;
    }
    logInfo("[Discovery] probe sent to ", config_.address, ":", config_.port, "\n");
}

DiscoveryScan::~DiscoveryScan() {
    finish();
}

void DiscoveryScan::finish() {
    if (finished_) {
        return;
    }
    finished_ = true;
    if (channel_) {
        channel_->close();
    }
}

std::optional<DeviceDescriptor> DiscoveryScan::next() {
    while (!finished_) {
        const auto left = remainingUntil(deadline_);
        if (left.count() == 0) {
            finish();
            break;
        }

        auto datagram = channel_->receive(left);
        if (!datagram) {
            if (!net::is_timeout(datagram.error())) {
                error_ = datagram.error();
                logError("[Discovery] receive failed: ", error_.message(), "\n");
            }
            finish();
            break;
        }
        if (datagram->payload == config::SDCP_DISCOVERY_PROBE) {
            // Our own broadcast looped back, or another client probing.
            continue;
        }

        auto descriptor = protocol::decodeDescriptor(datagram->payload);
        if (!descriptor) {
            ++discarded_;
            logError("[Discovery] discarding reply from ", datagram->sender, ": ",
                     descriptor.error(), "\n");
            continue;
        }
        if (!seen_.insert(descriptor->id).second) {
            continue;
        }
        logInfo("[Discovery] found '", descriptor->name, "' at ", descriptor->address,
                " (", descriptor->protocolVersion, ")\n");
        return std::move(*descriptor);
    }
    return std::nullopt;
}

expected<std::vector<DeviceDescriptor>> discover(std::unique_ptr<DatagramChannel> channel,
                                                 milliseconds timeout,
                                                 const DiscoveryConfig& config) {
    DiscoveryScan scan(std::move(channel), timeout, config);
    std::vector<DeviceDescriptor> found;
    while (auto descriptor = scan.next()) {
        found.push_back(std::move(*descriptor));
    }
    if (scan.error() && found.empty()) {
        return unexpected(scan.error());
    }
    return found;
}

expected<std::vector<DeviceDescriptor>> discover(milliseconds timeout,
                                                 const DiscoveryConfig& config) {
    net::NetService service;
    auto channel = std::make_unique<UdpDatagramChannel>(service.context(), config.bufferSize);
    if (auto ec = channel->open(); ec) {
        return unexpected(ec);
    }
    return discover(std::move(channel), timeout, config);
}

expected<DeviceDescriptor> probe(DatagramChannel& channel,
                                 const std::string& address,
                                 milliseconds timeout,
                                 const DiscoveryConfig& config) {
    const auto deadline = SteadyClock::now() + timeout;
    if (auto ec = channel.send(config::SDCP_DISCOVERY_PROBE, address, config.port, false); ec) {
        logError("[Discovery] probe to ", address, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }

    while (true) {
        const auto left = remainingUntil(deadline);
        if (left.count() == 0) {
            return unexpected(net::timed_out());
        }
        auto datagram = channel.receive(left);
        if (!datagram) {
            return unexpected(datagram.error());
        }
        if (datagram->sender != address) {
            logInfo("[Discovery] ignoring datagram from ", datagram->sender,
                    " while probing ", address, "\n");
            continue;
        }
        auto descriptor = protocol::decodeDescriptor(datagram->payload);
        if (!descriptor) {
            logError("[Discovery] malformed reply from ", address, ": ",
                     descriptor.error(), "\n");
            return unexpected(make_error_code(errc::decode_error));
        }
        return std::move(*descriptor);
    }
}

expected<DeviceDescriptor> probe(const std::string& address,
                                 milliseconds timeout,
                                 const DiscoveryConfig& config) {
    net::NetService service;
    UdpDatagramChannel channel(service.context(), config.bufferSize);
    if (auto ec = channel.open(); ec) {
        return unexpected(ec);
    }
    return probe(channel, address, timeout, config);
}

} // namespace sdcp::discovery
