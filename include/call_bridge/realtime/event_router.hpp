#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/realtime/tool_call.hpp"

namespace call_bridge {
namespace realtime {

struct RealtimeCallbacks {
    // Raw mu-law bytes, already base64-decoded.
    std::function<void(const std::string&)> on_audio;
    std::function<void(const std::string&)> on_text;
    std::function<void()> on_turn_completed;
    std::function<void(const ToolCall&)> on_tool_call;
    std::function<void(const std::string&)> on_error;
    std::function<void(const std::string&)> on_closed;
};

// Turns provider frames into callbacks. Malformed frames are logged and
// dropped.
class EventRouter {
public:
    EventRouter(std::string call_id, RealtimeCallbacks callbacks);

    void handle_text(const std::string& payload);
    void handle_binary(const std::string& payload);
    void handle_event(const nlohmann::json& event);

    const RealtimeCallbacks& callbacks() const { return callbacks_; }

private:
    void route_audio(const nlohmann::json& event);
    void route_text(const std::string& type, const nlohmann::json& event);
    void route_error(const nlohmann::json& event);

    std::string call_id_;
    RealtimeCallbacks callbacks_;
    ToolCallNormalizer normalizer_;
};

}
}
