#include "sdcp/protocol/Commands.hpp"
#include "sdcp/protocol/WireCodec.hpp"

#include "support/TestAssert.hpp"

#include <cstdint>
#include <string>
#include <vector>

using namespace sdcp::protocol;

static const char* kStatusMessage = R"({
    "Id": "f25273b12b094c5a8b9513a30ca60049",
    "Status": {
        "CurrentStatus": [1],
        "PreviousStatus": 0,
        "PrintInfo": {"Status": 13, "CurrentLayer": 20, "TotalLayer": 150, "Filename": "cube.ctb"},
        "FileTransferInfo": {"Status": 0}
    },
    "MainboardID": "ffffffff",
    "TimeStamp": 1687069655,
    "Topic": "sdcp/status/ffffffff"
})";

static const char* kResponseMessage = R"({
    "Id": "f25273b12b094c5a8b9513a30ca60049",
    "Data": {
        "Cmd": 386,
        "Data": {"Ack": 0, "VideoUrl": "rtsp://10.0.0.20:554/video"},
        "RequestID": "000000000001d354",
        "MainboardID": "ffffffff",
        "TimeStamp": 1687069655
    },
    "Topic": "sdcp/response/ffffffff"
})";

static void testDecodeStatus() {
    auto frame = decode(kStatusMessage);
    ASSERT_TRUE(frame.has_value(), "status decodes");
    if (!frame) return;
    ASSERT_TRUE(frame->kind == FrameKind::Status, "kind is status");
    ASSERT_EQ(frame->topic, std::string("status"), "topic category");
    ASSERT_EQ(frame->mainboardId, std::string("ffffffff"), "mainboard id from topic");
    ASSERT_EQ(frame->timestamp, static_cast<std::int64_t>(1687069655), "timestamp");
    ASSERT_TRUE(!frame->correlationId.has_value(), "status carries no correlation id");
    ASSERT_EQ(frame->payload["PrintInfo"]["CurrentLayer"].get<int>(), 20, "payload preserved");
    ASSERT_TRUE(frame->sourceId && *frame->sourceId == "f25273b12b094c5a8b9513a30ca60049", "source id");
}

static void testDecodeResponse() {
    auto frame = decode(kResponseMessage);
    ASSERT_TRUE(frame.has_value(), "response decodes");
    if (!frame) return;
    ASSERT_TRUE(frame->kind == FrameKind::Acknowledgement, "kind is acknowledgement");
    ASSERT_TRUE(frame->isAcknowledgement(), "acknowledgement with correlation id");
    ASSERT_EQ(*frame->correlationId, std::string("000000000001d354"), "request id");
    ASSERT_EQ(*frame->command, 386, "command echoed");
    ASSERT_TRUE(frame->ackCode() && *frame->ackCode() == 0, "ack code read");
    ASSERT_EQ(frame->payload["VideoUrl"].get<std::string>(), std::string("rtsp://10.0.0.20:554/video"), "payload url");
}

static void testUnknownTopicIsEvent() {
    auto frame = decode(R"({"Id":"x","Topic":"sdcp/fancy/mb1","Foo":{"Bar":1},"TimeStamp":5})");
    ASSERT_TRUE(frame.has_value(), "unknown topic decodes");
    if (!frame) return;
    ASSERT_TRUE(frame->kind == FrameKind::Event, "unknown topic is an event");
    ASSERT_EQ(frame->topic, std::string("fancy"), "category kept");
    ASSERT_EQ(frame->payload["Foo"]["Bar"].get<int>(), 1, "unknown body kept");
    ASSERT_TRUE(frame->payload.find("Topic") == frame->payload.end(), "envelope keys not in payload");

    auto again = decode(encode(*frame));
    ASSERT_TRUE(again.has_value() && *again == *frame, "event survives re-encoding");
}

static void testUnknownTopicBoardConflictKept() {
    auto frame = decode(R"({"Topic":"sdcp/fancy/mb1","MainboardID":"other","Level":3})");
    ASSERT_TRUE(frame.has_value(), "decodes");
    if (!frame) return;
    ASSERT_EQ(frame->mainboardId, std::string("mb1"), "topic names the board");
    ASSERT_EQ(frame->extensions["MainboardID"].get<std::string>(), std::string("other"),
              "disagreeing MainboardID kept");

    auto doc = Json::parse(encode(*frame));
    ASSERT_TRUE(doc["Data"].is_object(), "unknown category re-encoded with the Data wrapper");
    auto again = decode(encode(*frame));
    ASSERT_TRUE(again.has_value() && *again == *frame, "conflict survives re-encoding");
}

static Frame handBuilt(FrameKind kind, std::string topic, Json payload) {
    Frame frame;
    frame.kind = kind;
    frame.topic = std::move(topic);
    frame.mainboardId = "mb7";
    frame.timestamp = 1700000123;
    frame.payload = std::move(payload);
    return frame;
}

static void testHandBuiltFramesRoundTrip() {
    std::vector<Frame> frames;

    auto command = handBuilt(FrameKind::Command, "", Json{{"Url", "http://10.0.0.2/a.ctb"}});
    command.command = 128;
    command.correlationId = "00000000000000a1";
    command.from = 0;
    command.sourceId = "client-1";
    frames.push_back(command);

    auto ack = handBuilt(FrameKind::Acknowledgement, "", Json{{"Ack", 0}});
    ack.command = 128;
    ack.correlationId = "00000000000000a1";
    ack.dataExtensions = Json{{"Vendor", "x"}};
    ack.extensions = Json{{"Extra", true}};
    frames.push_back(ack);

    frames.push_back(handBuilt(FrameKind::Status, "", Json{{"CurrentStatus", Json::array({1})}}));
    frames.push_back(handBuilt(FrameKind::Error, "", Json{{"ErrorCode", 3}}));
    frames.push_back(handBuilt(FrameKind::Event, "", Json{{"Message", "hi"}, {"Type", 0}}));
    frames.push_back(handBuilt(FrameKind::Event, "attributes", Json{{"ProtocolVersion", "V3.0.0"}}));
    frames.push_back(handBuilt(FrameKind::Event, "custom",
        Json{{"MainboardID", "other"}, {"TimeStamp", "late"}, {"Topic", "inner"}, {"Id", 7}, {"Value", 1}}));

    for (const auto& frame : frames) {
        const auto wire = encode(frame);
        auto decoded = decode(wire);
        ASSERT_TRUE(decoded.has_value(), "hand-built frame decodes");
        if (!decoded) {
            sdcp::logError("  wire: ", wire, "\n");
            continue;
        }
        ASSERT_TRUE(*decoded == frame, "hand-built frame survives encode and decode");
        ASSERT_EQ(std::string(decoded->category()), std::string(frame.category()), "category agrees");
    }

    Frame status = frames[2];
    ASSERT_EQ(std::string(status.category()), std::string("status"), "empty topic takes the kind's category");
    status.topic = "status";
    ASSERT_TRUE(status == frames[2], "explicit and derived topic compare equal");
}

static void testIntegerRange() {
    auto ack = decode(R"({"Topic":"sdcp/response/mb","Data":{"Cmd":386,"RequestID":"r","Data":{"Ack":4294967296}}})");
    ASSERT_TRUE(!ack.has_value(), "Ack beyond int range is not read as success");
    if (!ack) {
        ASSERT_EQ(ack.error().where, std::string("Data.Data.Ack"), "error names Ack");
    }

    auto cmd = decode(R"({"Topic":"sdcp/response/mb","Data":{"Cmd":4294967682,"RequestID":"r","Data":{}}})");
    ASSERT_TRUE(!cmd.has_value(), "Cmd beyond int range rejected");
    if (!cmd) {
        ASSERT_EQ(cmd.error().where, std::string("Data.Cmd"), "error names Cmd");
    }

    auto from = decode(R"({"Topic":"sdcp/notice/mb","Data":{"From":-2147483649,"Data":{}}})");
    ASSERT_TRUE(!from.has_value(), "From beyond int range rejected");

    auto stamp = decode(R"({"Topic":"sdcp/status/mb","Status":{},"TimeStamp":18446744073709551615})");
    ASSERT_TRUE(!stamp.has_value(), "TimeStamp beyond int64 range rejected");

    auto negative = decode(R"({"Topic":"sdcp/response/mb","Data":{"Cmd":386,"RequestID":"r","Data":{"Ack":-1}}})");
    ASSERT_TRUE(negative && negative->ackCode() == -1, "negative Ack in range kept");

    Frame frame;
    frame.payload = Json{{"Ack", std::uint64_t{4294967296}}};
    ASSERT_TRUE(!frame.ackCode().has_value(), "oversized Ack has no code");
    frame.payload = Json{{"Ack", std::int64_t{-4294967296}}};
    ASSERT_TRUE(!frame.ackCode().has_value(), "undersized Ack has no code");
    frame.payload = Json{{"Ack", 2}};
    ASSERT_TRUE(frame.ackCode() == 2, "small Ack read");
}

static void testAttributesAndNotice() {
    auto attributes = decode(R"({"Id":"a","Attributes":{"ProtocolVersion":"V3.0.0"},"MainboardID":"mb","TimeStamp":1,"Topic":"sdcp/attributes/mb"})");
    ASSERT_TRUE(attributes.has_value(), "attributes decode");
    if (attributes) {
        ASSERT_TRUE(attributes->kind == FrameKind::Event, "attributes are events");
        ASSERT_EQ(attributes->payload["ProtocolVersion"].get<std::string>(), std::string("V3.0.0"), "attributes payload");
    }

    auto notice = decode(R"({"Id":"a","Data":{"Data":{"Message":"hi","Type":0},"MainboardID":"mb","TimeStamp":1},"Topic":"sdcp/notice/mb"})");
    ASSERT_TRUE(notice.has_value(), "notice without Cmd decodes");
    if (notice) {
        ASSERT_TRUE(notice->kind == FrameKind::Event, "notice is an event");
        ASSERT_TRUE(!notice->command.has_value(), "notice has no command");
    }

    auto error = decode(R"({"Id":"a","Data":{"Data":{"ErrorCode":1},"MainboardID":"mb","TimeStamp":1},"Topic":"sdcp/error/mb"})");
    ASSERT_TRUE(error.has_value() && error->kind == FrameKind::Error, "error topic");
}

static void testMalformed() {
    ASSERT_TRUE(!decode("not json").has_value(), "garbage rejected");
    ASSERT_TRUE(!decode("[1,2,3]").has_value(), "non-object rejected");
    ASSERT_TRUE(!decode(R"({"Id":"x"})").has_value(), "missing topic rejected");
    ASSERT_TRUE(!decode(R"({"Topic":"mqtt/status"})").has_value(), "foreign topic rejected");
    ASSERT_TRUE(!decode(R"({"Topic":"sdcp/status/mb"})").has_value(), "status without Status rejected");
    ASSERT_TRUE(!decode(R"({"Topic":"sdcp/response/mb","Data":{"Cmd":0,"Data":{}}})").has_value(),
                "response without RequestID rejected");
    ASSERT_TRUE(!decode(R"({"Topic":"sdcp/response/mb","Data":{"Cmd":"zero","RequestID":"r"}})").has_value(),
                "non-integer Cmd rejected");

    auto failure = decode(R"({"Topic":"sdcp/request/mb","Data":{"Cmd":0}})");
    ASSERT_TRUE(!failure.has_value(), "request without RequestID rejected");
    if (!failure) {
        ASSERT_EQ(failure.error().where, std::string("Data.RequestID"), "error names the field");
    }
}

static void testExtensionsPreserved() {
    auto frame = decode(R"({"Id":"i","Extra":true,"Data":{"Cmd":0,"RequestID":"r1","Data":{"Ack":0},"MainboardID":"mb","TimeStamp":9,"Vendor":"x"},"Topic":"sdcp/response/mb"})");
    ASSERT_TRUE(frame.has_value(), "decodes with unknown keys");
    if (!frame) return;
    ASSERT_TRUE(frame->extensions["Extra"].get<bool>(), "top-level extension kept");
    ASSERT_EQ(frame->dataExtensions["Vendor"].get<std::string>(), std::string("x"), "Data extension kept");

    auto again = decode(encode(*frame));
    ASSERT_TRUE(again.has_value(), "re-encoded frame decodes");
    if (again) {
        ASSERT_TRUE(*again == *frame, "extensions survive re-encoding");
    }
}

static void testMakeRequestLayout() {
    auto request = makeRequest(toCode(Command::PausePrint), Json::object(), "abcdef0123456789", "mb42", 0, 1700000000);
    auto doc = Json::parse(encode(request));
    ASSERT_EQ(doc["Topic"].get<std::string>(), std::string("sdcp/request/mb42"), "request topic");
    ASSERT_EQ(doc["Data"]["Cmd"].get<int>(), 129, "Cmd");
    ASSERT_EQ(doc["Data"]["RequestID"].get<std::string>(), std::string("abcdef0123456789"), "RequestID");
    ASSERT_EQ(doc["Data"]["MainboardID"].get<std::string>(), std::string("mb42"), "MainboardID");
    ASSERT_EQ(doc["Data"]["From"].get<int>(), 0, "From");
    ASSERT_EQ(doc["Data"]["TimeStamp"].get<std::int64_t>(), static_cast<std::int64_t>(1700000000), "TimeStamp");
    ASSERT_TRUE(doc["Data"]["Data"].is_object(), "empty arguments are an object");

    auto decoded = decode(encode(request));
    ASSERT_TRUE(decoded.has_value() && decoded->kind == FrameKind::Command, "request decodes as command");
}

static void testDescriptor() {
    const char* reply = R"({"Id":"979d4C788A4a78bC777A870F1A02867A","Data":{
        "Name":"Saturn4Ultra","MachineName":"ELEGOO Saturn 4 Ultra","BrandName":"ELEGOO",
        "MainboardIP":"192.168.1.50","MainboardID":"000000000001d354",
        "ProtocolVersion":"V3.0.0","FirmwareVersion":"V1.4.2","Capabilities":["VIDEO_STREAM"],
        "NetworkStatus":"wlan"}})";
    auto descriptor = decodeDescriptor(reply);
    ASSERT_TRUE(descriptor.has_value(), "descriptor decodes");
    if (!descriptor) return;
    ASSERT_EQ(descriptor->address, std::string("192.168.1.50"), "address");
    ASSERT_EQ(descriptor->mainboardId, std::string("000000000001d354"), "mainboard id");
    ASSERT_TRUE(descriptor->hasCapability("VIDEO_STREAM"), "capability flag");
    ASSERT_EQ(descriptor->extra["NetworkStatus"].get<std::string>(), std::string("wlan"), "extra kept");

    auto again = decodeDescriptor(encodeDescriptor(*descriptor));
    ASSERT_TRUE(again.has_value() && *again == *descriptor, "descriptor survives re-encoding");

    ASSERT_TRUE(!decodeDescriptor(R"({"Id":"x","Data":{"MainboardID":"m"}})").has_value(),
                "missing MainboardIP rejected");
    ASSERT_TRUE(!decodeDescriptor("M99999").has_value(), "discovery request echo rejected");
}

static void testHelpers() {
    ASSERT_TRUE(protocolMajor("V3.0.0") == 3, "V3.0.0 major");
    ASSERT_TRUE(protocolMajor("2.1") == 2, "bare major");
    ASSERT_TRUE(!protocolMajor("unknown").has_value(), "unparsable version");
    ASSERT_TRUE(isKeepalive("pong"), "pong is keepalive");
    ASSERT_TRUE(!isKeepalive("{}"), "json is not keepalive");
    ASSERT_TRUE(lookupCommand("pause_print") == 129, "command lookup");
    ASSERT_TRUE(!lookupCommand("make_coffee").has_value(), "unknown command");
    ASSERT_EQ(std::string(commandName(386)), std::string("video_stream"), "command name");
}

int main() {
    testDecodeStatus();
    testDecodeResponse();
    testUnknownTopicIsEvent();
    testUnknownTopicBoardConflictKept();
    testHandBuiltFramesRoundTrip();
    testIntegerRange();
    testAttributesAndNotice();
    testMalformed();
    testExtensionsPreserved();
    testMakeRequestLayout();
    testDescriptor();
    testHelpers();
    return reportResult("WireCodec");
}
