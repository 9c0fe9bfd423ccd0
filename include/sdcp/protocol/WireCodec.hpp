// WireCodec.hpp
// -----------------------------------------------------------------------------
// SDCP envelope codec. Pure functions: JSON text in, Frame / DeviceDescriptor
// out, and back. Responsibilities:
//   * Map topic categories to frame kinds and body layouts.
//   * Reject structurally broken envelopes with a DecodeError naming the field.
//   * Keep unknown-but-well-formed categories as Event frames.
//   * Build request envelopes for outgoing commands.

#pragma once

#include "sdcp/core/Expected.hpp"
#include "sdcp/protocol/DeviceDescriptor.hpp"
#include "sdcp/protocol/Frame.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace sdcp::protocol {

// Error payload used by expected
struct DecodeError {
    std::string where;
    std::string what;
};

std::ostream& operator<<(std::ostream& os, const DecodeError& error);

std::string encode(const Frame& frame);
[[nodiscard]] expected<Frame, DecodeError> decode(std::string_view text);

std::string encodeDescriptor(const DeviceDescriptor& descriptor);
[[nodiscard]] expected<DeviceDescriptor, DecodeError> decodeDescriptor(std::string_view text);

/// True for the device's reply to a keepalive `ping`.
bool isKeepalive(std::string_view text);

/// Request envelope for `command`, addressed to `mainboardId`.
Frame makeRequest(int command,
                  Json data,
                  std::string requestId,
                  std::string mainboardId,
                  int from,
                  std::int64_t timestamp);

/// Seconds since the Unix epoch, as carried in `TimeStamp`.
std::int64_t unixTimestamp();

} // namespace sdcp::protocol
