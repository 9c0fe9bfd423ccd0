#include "sdcp/protocol/Frame.hpp"

#include <limits>

namespace sdcp::protocol {

const char* toString(FrameKind kind) {
    switch (kind) {
        case FrameKind::Command:         return "command";
        case FrameKind::Acknowledgement: return "acknowledgement";
        case FrameKind::Status:          return "status";
        case FrameKind::Event:           return "event";
        case FrameKind::Error:           return "error";
    }
    return "unknown";
}

std::string_view defaultTopic(FrameKind kind) {
    switch (kind) {
        case FrameKind::Command:         return "request";
        case FrameKind::Acknowledgement: return "response";
        case FrameKind::Status:          return "status";
        case FrameKind::Error:           return "error";
        case FrameKind::Event:           return "notice";
    }
    return "notice";
}

std::optional<int> Frame::ackCode() const {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    auto it = payload.find("Ack");
    if (it == payload.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        const auto value = it->get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    }
    return std::nullopt;
}

bool operator==(const Frame& lhs, const Frame& rhs) {
    return lhs.kind == rhs.kind
        && lhs.category() == rhs.category()
        && lhs.mainboardId == rhs.mainboardId
        && lhs.correlationId == rhs.correlationId
        && lhs.command == rhs.command
        && lhs.sourceId == rhs.sourceId
        && lhs.from == rhs.from
        && lhs.timestamp == rhs.timestamp
        && lhs.payload == rhs.payload
        && lhs.dataExtensions == rhs.dataExtensions
        && lhs.extensions == rhs.extensions;
}

} // namespace sdcp::protocol
