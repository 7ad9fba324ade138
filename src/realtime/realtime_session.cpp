#include "call_bridge/realtime/realtime_session.hpp"

namespace call_bridge {
namespace realtime {

bool RealtimeSession::send_json(const nlohmann::json& payload) {
    return send_text(payload.dump());
}

bool RealtimeSession::send_audio(const std::string& ulaw_bytes) {
    if (ulaw_bytes.empty()) {
        return false;
    }
    return send_binary(ulaw_bytes);
}

bool RealtimeSession::commit_user_audio() {
    if (!send_json({{"type", "input_audio_buffer.commit"}})) {
        return false;
    }
    return send_json({{"type", "response.create"}, {"response", nlohmann::json::object()}});
}

bool RealtimeSession::cancel_response() {
    return send_json({{"type", "response.cancel"}});
}

bool RealtimeSession::send_tool_response(const std::string& tool_call_id,
                                         const ToolResult& result) {
    return send_json({
        {"type", "tool.response.create"},
        {"tool_response", {{"tool_call_id", tool_call_id}, {"output", result.serialize()}}},
    });
}

}
}
