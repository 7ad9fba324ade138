#include <catch2/catch_test_macros.hpp>

#include "call_bridge/telephony/carrier_protocol.hpp"
#include "call_bridge/telephony/carrier_stream.hpp"

#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace call_bridge;
using nlohmann::json;

namespace {

class RecordingSink : public telephony::CarrierEventSink {
public:
    std::vector<std::string> media;
    std::vector<std::string> marks;
    int stops = 0;
    std::vector<std::string> closes;

    void on_carrier_media(const std::string& payload) override { media.push_back(payload); }
    void on_carrier_mark(const std::string& name) override { marks.push_back(name); }
    void on_carrier_stop() override { ++stops; }
    void on_carrier_closed(const std::string& reason) override { closes.push_back(reason); }
};

std::string start_frame(const std::string& call_sid = "CA1") {
    return json{
        {"event", "start"},
        {"streamSid", "MZ1"},
        {"start", {{"callSid", call_sid}, {"streamSid", "MZ1"},
                   {"customParameters", {{"to", "+31201234567"}}}}},
    }.dump();
}

std::string media_frame(const std::string& payload) {
    return json{{"event", "media"}, {"streamSid", "MZ1"}, {"media", {{"payload", payload}}}}.dump();
}

}

TEST_CASE("carrier frames are parsed by event name") {
    auto start = telephony::parse_carrier_frame(start_frame());
    REQUIRE(start.has_value());
    REQUIRE(start->kind == telephony::CarrierEventKind::Start);
    REQUIRE(start->call_id == "CA1");
    REQUIRE(start->stream_id == "MZ1");
    REQUIRE(start->custom_parameters.at("to") == "+31201234567");

    auto legacy = telephony::parse_carrier_frame(
        json{{"event", "start"}, {"start", {{"callId", "C2"}, {"streamId", "S2"}}}}.dump());
    REQUIRE(legacy->call_id == "C2");
    REQUIRE(legacy->stream_id == "S2");

    auto media = telephony::parse_carrier_frame(media_frame("AAAA"));
    REQUIRE(media->kind == telephony::CarrierEventKind::Media);
    REQUIRE(media->payload == "AAAA");

    auto mark = telephony::parse_carrier_frame(
        json{{"event", "mark"}, {"mark", {{"name", "response-1"}}}}.dump());
    REQUIRE(mark->mark_name == "response-1");

    REQUIRE_FALSE(telephony::parse_carrier_frame("{oops").has_value());
    REQUIRE_FALSE(telephony::parse_carrier_frame(json{{"media", 1}}.dump()).has_value());
    REQUIRE(telephony::parse_carrier_frame(json{{"event", "dtmf"}}.dump())->kind ==
            telephony::CarrierEventKind::Unknown);
}

TEST_CASE("outbound frames carry the stream id") {
    const auto media = json::parse(telephony::make_media_frame("MZ1", "AAAA"));
    REQUIRE(media == json{{"event", "media"}, {"streamSid", "MZ1"}, {"media", {{"payload", "AAAA"}}}});

    const auto mark = json::parse(telephony::make_mark_frame("MZ1", "response-2"));
    REQUIRE(mark.at("mark").at("name") == "response-2");

    const auto clear = json::parse(telephony::make_clear_frame("MZ1"));
    REQUIRE(clear == json{{"event", "clear"}, {"streamSid", "MZ1"}});
}

TEST_CASE("control frames before start are buffered and replayed") {
    auto sink = std::make_shared<RecordingSink>();
    int created = 0;
    telephony::CarrierStream stream("conn-1", [&](const telephony::CarrierEvent& start) {
        ++created;
        REQUIRE(start.call_id == "CA1");
        return sink;
    });

    stream.handle_text(json{{"event", "connected"}}.dump());
    stream.handle_text(json{{"event", "mark"}, {"mark", {{"name", "early"}}}}.dump());
    REQUIRE(stream.buffered() == 1);
    REQUIRE_FALSE(stream.started());

    stream.handle_text(start_frame());
    REQUIRE(created == 1);
    REQUIRE(stream.started());
    REQUIRE(stream.buffered() == 0);
    REQUIRE(sink->marks == std::vector<std::string>{"early"});

    stream.handle_text(media_frame("live"));
    stream.handle_text(json{{"event", "mark"}, {"mark", {{"name", "response-1"}}}}.dump());
    stream.handle_text(json{{"event", "stop"}}.dump());
    REQUIRE(sink->media == std::vector<std::string>{"live"});
    REQUIRE(sink->marks == std::vector<std::string>{"early", "response-1"});
    REQUIRE(sink->stops == 1);
}

TEST_CASE("media before start is not buffered") {
    auto sink = std::make_shared<RecordingSink>();
    telephony::CarrierStream stream("conn-1", [&](const telephony::CarrierEvent&) { return sink; });

    stream.handle_text(media_frame("early-1"));
    stream.handle_text(media_frame("early-2"));
    REQUIRE(stream.buffered() == 0);

    stream.handle_text(start_frame());
    REQUIRE(sink->media.empty());
}

TEST_CASE("a second start never creates another session") {
    auto sink = std::make_shared<RecordingSink>();
    int created = 0;
    telephony::CarrierStream stream("conn-1", [&](const telephony::CarrierEvent&) {
        ++created;
        return sink;
    });
    stream.handle_text(start_frame("CA1"));
    stream.handle_text(start_frame("CA2"));
    REQUIRE(created == 1);
    REQUIRE(stream.call_id() == "CA1");
}

TEST_CASE("the pre-start buffer is bounded") {
    telephony::CarrierStream stream("conn-1", [](const telephony::CarrierEvent&) {
        return std::shared_ptr<telephony::CarrierEventSink>();
    });
    for (size_t i = 0; i < telephony::CarrierStream::kMaxBufferedFrames + 10; ++i) {
        stream.handle_text(json{{"event", "mark"}, {"mark", {{"name", "m"}}}}.dump());
    }
    REQUIRE(stream.buffered() == telephony::CarrierStream::kMaxBufferedFrames);
}

TEST_CASE("socket close reaches the session exactly once") {
    auto sink = std::make_shared<RecordingSink>();
    telephony::CarrierStream stream("conn-1", [&](const telephony::CarrierEvent&) { return sink; });
    stream.handle_text(start_frame());

    stream.handle_closed("socket closed");
    stream.handle_closed("socket error");
    stream.handle_text(media_frame("late"));

    REQUIRE(sink->closes == std::vector<std::string>{"socket closed"});
    REQUIRE(sink->media.empty());
}
