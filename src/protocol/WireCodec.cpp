// WireCodec.cpp
// -----------------------------------------------------------------------------
// Implements the SDCP envelope codec declared in WireCodec.hpp. nlohmann::json
// is used in its non-throwing parse mode; every field access is type-checked
// before it is read so a hostile message cannot raise.

#include "sdcp/protocol/WireCodec.hpp"

#include "sdcp/protocol/SdcpConfig.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <limits>

namespace sdcp::protocol {

namespace {

enum class Layout {
    DataWrapped,  // request / response / error / notice: body under "Data"
    StatusBody,   // "Status" object at the top level
    AttributesBody,
    Flat,         // unknown category: Data wrapper if present, else the whole envelope
};

Layout layoutFor(std::string_view topic) {
    if (topic == "request" || topic == "response" || topic == "error" || topic == "notice") {
        return Layout::DataWrapped;
    }
    if (topic == "status") {
        return Layout::StatusBody;
    }
    if (topic == "attributes") {
        return Layout::AttributesBody;
    }
    return Layout::Flat;
}

FrameKind kindFor(std::string_view topic) {
    if (topic == "request") return FrameKind::Command;
    if (topic == "response") return FrameKind::Acknowledgement;
    if (topic == "status") return FrameKind::Status;
    if (topic == "error") return FrameKind::Error;
    return FrameKind::Event;
}

unexpected_t<DecodeError> fail(std::string where, std::string what) {
    return unexpected(DecodeError{std::move(where), std::move(what)});
}

bool isInteger(const Json& value) {
    return value.is_number_integer() || value.is_number_unsigned();
}

// Optional string member; present-but-wrong-type is an error.
expected<std::optional<std::string>, DecodeError>
optionalString(const Json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return fail(where + "." + key, "not a string");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

expected<std::optional<std::int64_t>, DecodeError>
optionalInteger(const Json& object, const char* key, const std::string& where) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::optional<std::int64_t>{};
    }
    if (!isInteger(*it)) {
        return fail(where + "." + key, "not an integer");
    }
    if (it->is_number_unsigned()
        && it->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return fail(where + "." + key, "out of range");
    }
    return std::optional<std::int64_t>{it->get<std::int64_t>()};
}

// Optional integer member that must fit in an int.
expected<std::optional<int>, DecodeError>
optionalInt(const Json& object, const char* key, const std::string& where) {
    auto value = optionalInteger(object, key, where);
    if (!value) {
        return unexpected(value.error());
    }
    if (!*value) {
        return std::optional<int>{};
    }
    if (**value < std::numeric_limits<int>::min() || **value > std::numeric_limits<int>::max()) {
        return fail(where + "." + key, "out of range");
    }
    return std::optional<int>{static_cast<int>(**value)};
}

Json without(const Json& object, std::initializer_list<const char*> keys) {
    Json rest = Json::object();
    for (auto it = object.begin(); it != object.end(); ++it) {
        const bool reserved = std::any_of(keys.begin(), keys.end(),
            [&](const char* key){ return it.key() == key; });
        if (!reserved) {
            rest[it.key()] = it.value();
        }
    }
    return rest;
}

// Shared top-level fields of the Status/Attributes/Flat layouts.
expected<void, DecodeError> readTopLevelHeader(const Json& doc, Frame& frame) {
    auto board = optionalString(doc, "MainboardID", "envelope");
    if (!board) return unexpected(board.error());
    if (frame.mainboardId.empty() && *board) {
        frame.mainboardId = **board;
    }
    auto stamp = optionalInteger(doc, "TimeStamp", "envelope");
    if (!stamp) return unexpected(stamp.error());
    frame.timestamp = stamp->value_or(0);
    return {};
}

expected<void, DecodeError> decodeDataWrapped(const Json& doc, Frame& frame) {
    auto dataIt = doc.find("Data");
    if (dataIt == doc.end() || !dataIt->is_object()) {
        return fail("Data", "missing or not an object");
    }
    const Json& data = *dataIt;
    const bool correlated = frame.kind == FrameKind::Command
                         || frame.kind == FrameKind::Acknowledgement;

    auto cmd = optionalInt(data, "Cmd", "Data");
    if (!cmd) return unexpected(cmd.error());
    if (correlated && !*cmd) {
        return fail("Data.Cmd", "required for " + frame.topic);
    }
    frame.command = *cmd;

    auto requestId = optionalString(data, "RequestID", "Data");
    if (!requestId) return unexpected(requestId.error());
    if (correlated && !*requestId) {
        return fail("Data.RequestID", "required for " + frame.topic);
    }
    frame.correlationId = *requestId;

    auto board = optionalString(data, "MainboardID", "Data");
    if (!board) return unexpected(board.error());
    if (frame.mainboardId.empty() && *board) {
        frame.mainboardId = **board;
    }

    auto stamp = optionalInteger(data, "TimeStamp", "Data");
    if (!stamp) return unexpected(stamp.error());
    frame.timestamp = stamp->value_or(0);

    auto from = optionalInt(data, "From", "Data");
    if (!from) return unexpected(from.error());
    frame.from = *from;

    if (auto inner = data.find("Data"); inner != data.end()) {
        frame.payload = *inner;
    }
    // An Ack that does not fit an int must not read as success.
    if (frame.kind == FrameKind::Acknowledgement && frame.payload.is_object()) {
        auto ack = optionalInt(frame.payload, "Ack", "Data.Data");
        if (!ack) return unexpected(ack.error());
    }
    frame.dataExtensions = without(data, {"Cmd", "RequestID", "MainboardID", "TimeStamp", "From", "Data"});
    frame.extensions = without(doc, {"Topic", "Id", "Data"});
    return {};
}

expected<void, DecodeError> decodeBody(const Json& doc, const char* bodyKey, Frame& frame) {
    auto bodyIt = doc.find(bodyKey);
    if (bodyIt == doc.end() || !bodyIt->is_object()) {
        return fail(bodyKey, "missing or not an object");
    }
    frame.payload = *bodyIt;
    if (auto header = readTopLevelHeader(doc, frame); !header) {
        return header;
    }
    frame.extensions = without(doc, {"Topic", "Id", bodyKey, "MainboardID", "TimeStamp"});
    return {};
}

expected<void, DecodeError> decodeFlat(const Json& doc, Frame& frame) {
    if (auto header = readTopLevelHeader(doc, frame); !header) {
        return header;
    }
    frame.payload = without(doc, {"Topic", "Id", "MainboardID", "TimeStamp"});
    // A board id that disagrees with the topic is kept, not overwritten.
    if (auto board = doc.find("MainboardID"); board != doc.end() && *board != Json(frame.mainboardId)) {
        frame.extensions["MainboardID"] = *board;
    }
    return {};
}

bool hasDataWrapper(const Json& doc) {
    auto it = doc.find("Data");
    return it != doc.end() && it->is_object();
}

std::string takeString(const Json& object, const char* key, Json& extra) {
    auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    if (!it->is_string()) {
        // Wrong type for a known field: keep it verbatim rather than guess.
        extra[key] = *it;
        return {};
    }
    return it->get<std::string>();
}

} // namespace

std::ostream& operator<<(std::ostream& os, const DecodeError& error) {
    return os << error.where << ": " << error.what;
}

std::string encode(const Frame& frame) {
    const std::string topic(frame.category());

    Json doc = frame.extensions.is_object() ? frame.extensions : Json::object();
    if (frame.sourceId) {
        doc["Id"] = *frame.sourceId;
    }

    switch (layoutFor(topic)) {
        // Unknown categories go out with the Data wrapper so payload keys can
        // never collide with envelope keys.
        case Layout::Flat:
        case Layout::DataWrapped: {
            Json data = frame.dataExtensions.is_object() ? frame.dataExtensions : Json::object();
            if (frame.command) data["Cmd"] = *frame.command;
            data["Data"] = frame.payload;
            if (frame.correlationId) data["RequestID"] = *frame.correlationId;
            data["MainboardID"] = frame.mainboardId;
            data["TimeStamp"] = frame.timestamp;
            if (frame.from) data["From"] = *frame.from;
            doc["Data"] = std::move(data);
            break;
        }
        case Layout::StatusBody:
            doc["Status"] = frame.payload;
            doc["MainboardID"] = frame.mainboardId;
            doc["TimeStamp"] = frame.timestamp;
            break;
        case Layout::AttributesBody:
            doc["Attributes"] = frame.payload;
            doc["MainboardID"] = frame.mainboardId;
            doc["TimeStamp"] = frame.timestamp;
            break;
    }

    doc["Topic"] = std::string(config::SDCP_TOPIC_PREFIX) + topic + "/" + frame.mainboardId;
    return doc.dump();
}

expected<Frame, DecodeError> decode(std::string_view text) {
    const Json doc = Json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return fail("envelope", "invalid JSON");
    }
    if (!doc.is_object()) {
        return fail("envelope", "not an object");
    }

    auto topicIt = doc.find("Topic");
    if (topicIt == doc.end() || !topicIt->is_string()) {
        return fail("Topic", "missing or not a string");
    }
    const auto fullTopic = topicIt->get<std::string>();
    if (fullTopic.rfind(config::SDCP_TOPIC_PREFIX, 0) != 0) {
        return fail("Topic", "not an sdcp topic: " + fullTopic);
    }
    const auto rest = fullTopic.substr(config::SDCP_TOPIC_PREFIX.size());
    const auto slash = rest.find('/');

    Frame frame;
    frame.topic = rest.substr(0, slash);
    if (frame.topic.empty()) {
        return fail("Topic", "empty category");
    }
    if (slash != std::string::npos) {
        frame.mainboardId = rest.substr(slash + 1);
    }
    frame.kind = kindFor(frame.topic);

    auto sourceId = optionalString(doc, "Id", "envelope");
    if (!sourceId) return unexpected(sourceId.error());
    frame.sourceId = *sourceId;

    expected<void, DecodeError> body;
    switch (layoutFor(frame.topic)) {
        case Layout::DataWrapped:    body = decodeDataWrapped(doc, frame); break;
        case Layout::StatusBody:     body = decodeBody(doc, "Status", frame); break;
        case Layout::AttributesBody: body = decodeBody(doc, "Attributes", frame); break;
        case Layout::Flat:
            body = hasDataWrapper(doc) ? decodeDataWrapped(doc, frame) : decodeFlat(doc, frame);
            break;
    }
    if (!body) {
        return unexpected(body.error());
    }
    return frame;
}

std::string encodeDescriptor(const DeviceDescriptor& descriptor) {
    Json data = descriptor.extra.is_object() ? descriptor.extra : Json::object();
    data["MainboardIP"] = descriptor.address;
    data["MainboardID"] = descriptor.mainboardId;
    const std::array<std::pair<const char*, const std::string*>, 5> optionalFields{{
        {"Name", &descriptor.name},
        {"MachineName", &descriptor.machineName},
        {"BrandName", &descriptor.brandName},
        {"ProtocolVersion", &descriptor.protocolVersion},
        {"FirmwareVersion", &descriptor.firmwareVersion},
    }};
    for (const auto& [key, value] : optionalFields) {
        if (!value->empty()) {
            data[key] = *value;
        }
    }
    if (!descriptor.capabilities.empty()) {
        data["Capabilities"] = descriptor.capabilities;
    }

    Json doc = Json::object();
    doc["Id"] = descriptor.id;
    doc["Data"] = std::move(data);
    return doc.dump();
}

expected<DeviceDescriptor, DecodeError> decodeDescriptor(std::string_view text) {
    const Json doc = Json::parse(text.begin(), text.end(), nullptr, false);
    if (doc.is_discarded()) {
        return fail("reply", "invalid JSON");
    }
    if (!doc.is_object()) {
        return fail("reply", "not an object");
    }

    auto idIt = doc.find("Id");
    if (idIt == doc.end() || !idIt->is_string()) {
        return fail("Id", "missing or not a string");
    }
    auto dataIt = doc.find("Data");
    if (dataIt == doc.end() || !dataIt->is_object()) {
        return fail("Data", "missing or not an object");
    }
    const Json& data = *dataIt;

    auto ipIt = data.find("MainboardIP");
    if (ipIt == data.end() || !ipIt->is_string()) {
        return fail("Data.MainboardIP", "missing or not a string");
    }
    auto boardIt = data.find("MainboardID");
    if (boardIt == data.end() || !boardIt->is_string()) {
        return fail("Data.MainboardID", "missing or not a string");
    }

    DeviceDescriptor descriptor;
    descriptor.id = idIt->get<std::string>();
    descriptor.address = ipIt->get<std::string>();
    descriptor.mainboardId = boardIt->get<std::string>();
    descriptor.extra = without(data, {"MainboardIP", "MainboardID", "Name", "MachineName",
                                      "BrandName", "ProtocolVersion", "FirmwareVersion",
                                      "Capabilities"});
    descriptor.name = takeString(data, "Name", descriptor.extra);
    descriptor.machineName = takeString(data, "MachineName", descriptor.extra);
    descriptor.brandName = takeString(data, "BrandName", descriptor.extra);
    descriptor.protocolVersion = takeString(data, "ProtocolVersion", descriptor.extra);
    descriptor.firmwareVersion = takeString(data, "FirmwareVersion", descriptor.extra);

    if (auto caps = data.find("Capabilities"); caps != data.end()) {
        if (!caps->is_array()) {
            return fail("Data.Capabilities", "not an array");
        }
        for (const auto& flag : *caps) {
            if (!flag.is_string()) {
                return fail("Data.Capabilities", "non-string flag");
            }
            descriptor.capabilities.push_back(flag.get<std::string>());
        }
    }
    return descriptor;
}

bool isKeepalive(std::string_view text) {
    return text == config::SDCP_KEEPALIVE_REPLY;
}

Frame makeRequest(int command,
                  Json data,
                  std::string requestId,
                  std::string mainboardId,
                  int from,
                  std::int64_t timestamp) {
    Frame frame;
    frame.kind = FrameKind::Command;
    frame.topic = "request";
    frame.mainboardId = std::move(mainboardId);
    frame.command = command;
    frame.correlationId = std::move(requestId);
    frame.from = from;
    frame.timestamp = timestamp;
    frame.payload = data.is_null() ? Json::object() : std::move(data);
    return frame;
}

std::int64_t unixTimestamp() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace sdcp::protocol
