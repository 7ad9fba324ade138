#pragma once

#include <future>
#include <string>

#include "call_bridge/realtime/tool_call.hpp"

namespace call_bridge {
namespace call {

// What the registry and the tool webhook need from a live call.
class ActiveCall {
public:
    virtual ~ActiveCall() = default;

    virtual std::string call_id() const = 0;

    // Queued behind earlier tool calls of the same call.
    virtual std::future<realtime::ToolResult> submit_tool_call(realtime::ToolCall call) = 0;
};

}
}
