#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace call_bridge {
namespace telephony {

enum class CarrierEventKind {
    Connected,
    Start,
    Media,
    Mark,
    Stop,
    Unknown,
};

struct CarrierEvent {
    CarrierEventKind kind = CarrierEventKind::Unknown;
    std::string type;
    std::string call_id;
    std::string stream_id;
    // Base64 mu-law for media frames.
    std::string payload;
    std::string mark_name;
    nlohmann::json custom_parameters = nlohmann::json::object();
};

// std::nullopt for malformed JSON or frames without an event name.
std::optional<CarrierEvent> parse_carrier_frame(const std::string& text);

std::string make_media_frame(const std::string& stream_id, const std::string& base64_payload);
std::string make_mark_frame(const std::string& stream_id, const std::string& name);
std::string make_clear_frame(const std::string& stream_id);

const char* to_string(CarrierEventKind kind);

}
}
