#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/realtime/tool_call.hpp"

namespace call_bridge {
namespace realtime {

// One open connection to the AI provider for one call. Sends after close are
// dropped and reported as false.
class RealtimeSession {
public:
    virtual ~RealtimeSession() = default;

    virtual const std::string& id() const = 0;
    virtual bool send_text(const std::string& payload) = 0;
    virtual bool send_binary(const std::string& payload) = 0;
    virtual bool ping() = 0;
    virtual void close(const std::string& reason) = 0;
    virtual bool closed() const = 0;

    bool send_json(const nlohmann::json& payload);
    bool send_audio(const std::string& ulaw_bytes);
    bool commit_user_audio();
    bool cancel_response();
    bool send_tool_response(const std::string& tool_call_id, const ToolResult& result);
};

}
}
