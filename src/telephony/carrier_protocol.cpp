#include "call_bridge/telephony/carrier_protocol.hpp"

#include <initializer_list>

namespace call_bridge {
namespace telephony {

namespace {

std::string first_string(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return "";
    }
    for (const char* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

const nlohmann::json& section(const nlohmann::json& frame, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = frame.find(key);
    if (it == frame.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

CarrierEventKind kind_from_name(const std::string& name) {
    if (name == "connected") {
        return CarrierEventKind::Connected;
    }
    if (name == "start") {
        return CarrierEventKind::Start;
    }
    if (name == "media") {
        return CarrierEventKind::Media;
    }
    if (name == "mark") {
        return CarrierEventKind::Mark;
    }
    if (name == "stop") {
        return CarrierEventKind::Stop;
    }
    return CarrierEventKind::Unknown;
}

}

std::optional<CarrierEvent> parse_carrier_frame(const std::string& text) {
    const auto frame = nlohmann::json::parse(text, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        return std::nullopt;
    }
    const auto name = first_string(frame, {"event"});
    if (name.empty()) {
        return std::nullopt;
    }

    CarrierEvent event;
    event.type = name;
    event.kind = kind_from_name(name);
    event.stream_id = first_string(frame, {"streamSid", "streamId"});

    switch (event.kind) {
        case CarrierEventKind::Start: {
            const auto& start = section(frame, "start");
            event.call_id = first_string(start, {"callSid", "callId"});
            const auto stream_id = first_string(start, {"streamSid", "streamId"});
            if (!stream_id.empty()) {
                event.stream_id = stream_id;
            }
            auto params = start.find("customParameters");
            if (params != start.end() && params->is_object()) {
                event.custom_parameters = *params;
            }
            break;
        }
        case CarrierEventKind::Media:
            event.payload = first_string(section(frame, "media"), {"payload"});
            break;
        case CarrierEventKind::Mark:
            event.mark_name = first_string(section(frame, "mark"), {"name"});
            break;
        case CarrierEventKind::Stop:
            event.call_id = first_string(section(frame, "stop"), {"callSid", "callId"});
            break;
        case CarrierEventKind::Connected:
        case CarrierEventKind::Unknown:
            break;
    }
    return event;
}

std::string make_media_frame(const std::string& stream_id, const std::string& base64_payload) {
    return nlohmann::json{
        {"event", "media"},
        {"streamSid", stream_id},
        {"media", {{"payload", base64_payload}}},
    }.dump();
}

std::string make_mark_frame(const std::string& stream_id, const std::string& name) {
    return nlohmann::json{
        {"event", "mark"},
        {"streamSid", stream_id},
        {"mark", {{"name", name}}},
    }.dump();
}

std::string make_clear_frame(const std::string& stream_id) {
    return nlohmann::json{{"event", "clear"}, {"streamSid", stream_id}}.dump();
}

const char* to_string(CarrierEventKind kind) {
    switch (kind) {
        case CarrierEventKind::Connected:
            return "connected";
        case CarrierEventKind::Start:
            return "start";
        case CarrierEventKind::Media:
            return "media";
        case CarrierEventKind::Mark:
            return "mark";
        case CarrierEventKind::Stop:
            return "stop";
        case CarrierEventKind::Unknown:
            break;
    }
    return "unknown";
}

}
}
