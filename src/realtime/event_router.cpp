#include "call_bridge/realtime/event_router.hpp"

#include <initializer_list>
#include <utility>

#include <websocketpp/base64/base64.hpp>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace realtime {

namespace {

bool is_audio_delta(const std::string& type) {
    return type == "response.audio.delta" || type == "response.output_audio.delta";
}

bool is_text_delta(const std::string& type) {
    return type == "response.output_text.delta" || type == "response.text.delta" ||
           type == "response.message.delta";
}

bool is_turn_completed(const std::string& type) {
    return type == "response.completed" || type == "response.done" ||
           type == "response.output_audio.done";
}

std::string first_string(const nlohmann::json& object, std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return "";
    }
    for (const auto* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return "";
}

const nlohmann::json& child(const nlohmann::json& object, const char* key) {
    static const nlohmann::json empty;
    auto it = object.find(key);
    if (it == object.end()) {
        return empty;
    }
    return *it;
}

}

EventRouter::EventRouter(std::string call_id, RealtimeCallbacks callbacks)
    : call_id_(std::move(call_id)),
      callbacks_(std::move(callbacks)) {}

void EventRouter::handle_text(const std::string& payload) {
    auto event = nlohmann::json::parse(payload, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        logging::warn("Dropping malformed realtime frame",
                      {kv("call_id", call_id_), kv("bytes", payload.size())});
        return;
    }
    handle_event(event);
}

void EventRouter::handle_binary(const std::string& payload) {
    if (payload.empty() || !callbacks_.on_audio) {
        return;
    }
    callbacks_.on_audio(payload);
}

void EventRouter::handle_event(const nlohmann::json& event) {
    const auto type = first_string(event, {"type"});
    if (is_audio_delta(type)) {
        route_audio(event);
        return;
    }
    if (is_text_delta(type)) {
        route_text(type, event);
        return;
    }
    if (is_turn_completed(type)) {
        if (callbacks_.on_turn_completed) {
            callbacks_.on_turn_completed();
        }
        return;
    }
    if (type == "error") {
        route_error(event);
        return;
    }

    const auto calls = normalizer_.normalize_frame(event);
    if (!calls.empty()) {
        for (const auto& call : calls) {
            logging::info("Realtime tool call received",
                          {kv("call_id", call_id_),
                           kv("tool_call_id", call.id),
                           kv("tool", call.name)});
            if (callbacks_.on_tool_call) {
                callbacks_.on_tool_call(call);
            }
        }
        return;
    }
    logging::debug("Ignoring realtime event", {kv("call_id", call_id_), kv("type", type)});
}

void EventRouter::route_audio(const nlohmann::json& event) {
    const auto encoded = first_string(event, {"audio", "delta", "data"});
    if (encoded.empty()) {
        return;
    }
    const auto audio = websocketpp::base64_decode(encoded);
    if (!audio.empty() && callbacks_.on_audio) {
        callbacks_.on_audio(audio);
    }
}

void EventRouter::route_text(const std::string& type, const nlohmann::json& event) {
    std::string text;
    if (type == "response.message.delta") {
        text = first_string(child(event, "delta"), {"text"});
        if (text.empty()) {
            text = first_string(child(event, "message"), {"content", "text"});
        }
    } else {
        text = first_string(event, {"text", "delta"});
    }
    if (!text.empty() && callbacks_.on_text) {
        callbacks_.on_text(text);
    }
}

void EventRouter::route_error(const nlohmann::json& event) {
    auto message = first_string(child(event, "error"), {"message", "code"});
    if (message.empty()) {
        message = first_string(event, {"message", "error"});
    }
    if (message.empty()) {
        message = "unknown realtime error";
    }
    logging::error("Realtime session reported an error",
                   {kv("call_id", call_id_), kv("error", message)});
    if (callbacks_.on_error) {
        callbacks_.on_error(message);
    }
}

}
}
