#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/discovery/DatagramChannel.hpp"
#include "sdcp/protocol/DeviceDescriptor.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace sdcp::discovery {

using protocol::DeviceDescriptor;

struct DiscoveryConfig {
    unsigned short port = config::SDCP_DISCOVERY_PORT;
    std::string address = std::string(config::SDCP_BROADCAST_ADDRESS);
    std::size_t bufferSize = config::SDCP_DATAGRAM_BUFFER_SIZE;
};

/**
 * @brief One broadcast probe and the replies that arrive within its window.
 *
 * Construction sends the probe. `next()` blocks until the next unique
 * descriptor arrives or the window closes, after which it returns nullopt for
 * good. Replies that fail to decode are logged and counted; a second reply from
 * an already-seen device id is dropped.
 */
class DiscoveryScan {
public:
    DiscoveryScan(std::unique_ptr<DatagramChannel> channel,
                  milliseconds window,
                  DiscoveryConfig config = {});
    ~DiscoveryScan();

    DiscoveryScan(const DiscoveryScan&) = delete;
    DiscoveryScan& operator=(const DiscoveryScan&) = delete;

    std::optional<DeviceDescriptor> next();

    bool finished() const { return finished_; }

    /// Set when the probe could not be sent or the channel failed mid-window.
    const error_code& error() const { return error_; }

    std::size_t discardedReplies() const { return discarded_; }

private:
    void finish();

    std::unique_ptr<DatagramChannel> channel_;
    DiscoveryConfig config_;
    std::chrono::steady_clock::time_point deadline_;
    std::unordered_set<std::string> seen_;
    error_code error_;
    std::size_t discarded_ = 0;
    bool finished_ = false;
};

/// Broadcast scan on a private I/O thread; collects every unique reply.
expected<std::vector<DeviceDescriptor>> discover(milliseconds timeout,
                                                 const DiscoveryConfig& config = {});

/// Same, over a caller-supplied channel.
expected<std::vector<DeviceDescriptor>> discover(std::unique_ptr<DatagramChannel> channel,
                                                 milliseconds timeout,
                                                 const DiscoveryConfig& config = {});

/// Unicast probe of one known address.
expected<DeviceDescriptor> probe(const std::string& address,
                                 milliseconds timeout,
                                 const DiscoveryConfig& config = {});

expected<DeviceDescriptor> probe(DatagramChannel& channel,
                                 const std::string& address,
                                 milliseconds timeout,
                                 const DiscoveryConfig& config = {});

} // namespace sdcp::discovery
