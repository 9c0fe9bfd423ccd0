#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sdcp::protocol {

using Json = nlohmann::json;

enum class FrameKind : std::uint8_t {
    Command,          ///< sdcp/request: client to device
    Acknowledgement,  ///< sdcp/response: reply to one request
    Status,           ///< sdcp/status: spontaneous telemetry
    Event,            ///< sdcp/attributes, sdcp/notice and unknown topics
    Error,            ///< sdcp/error
};

const char* toString(FrameKind kind);

/// Topic category a frame of @p kind is sent under when it names none.
std::string_view defaultTopic(FrameKind kind);

/**
 * @brief One SDCP message, decoded.
 *
 * `payload` is the open part of the message (inner `Data` for request/response/
 * error/notice, `Status` for status, `Attributes` for attributes). Fields the
 * codec does not model are kept in `dataExtensions` (unknown keys of the
 * `Data` wrapper) and `extensions` (unknown top-level keys), so nothing a
 * device sends is silently dropped.
 */
struct Frame {
    FrameKind kind = FrameKind::Event;
    std::string topic;                         ///< category: "status", "response", ...
    std::string mainboardId;
    std::optional<std::string> correlationId;  ///< Data.RequestID
    std::optional<int> command;                ///< Data.Cmd
    std::optional<std::string> sourceId;       ///< top-level Id
    std::optional<int> from;                   ///< Data.From
    std::int64_t timestamp = 0;                ///< TimeStamp, seconds since epoch
    Json payload = Json::object();
    Json dataExtensions = Json::object();
    Json extensions = Json::object();

    /// `topic`, or the default category for `kind` when it is empty.
    std::string_view category() const {
        return topic.empty() ? defaultTopic(kind) : std::string_view(topic);
    }

    bool isAcknowledgement() const {
        return kind == FrameKind::Acknowledgement && correlationId.has_value();
    }

    /// `Ack` of an acknowledgement payload, if present and an integer that
    /// fits in an int.
    std::optional<int> ackCode() const;
};

/// Field-wise equality; topics compare by category().
bool operator==(const Frame& lhs, const Frame& rhs);
inline bool operator!=(const Frame& lhs, const Frame& rhs) { return !(lhs == rhs); }

} // namespace sdcp::protocol
