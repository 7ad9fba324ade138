#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/realtime/tool_call.hpp"
#include "call_bridge/registry/session_registry.hpp"
#include "call_bridge/server/rest_response.hpp"

namespace call_bridge {

constexpr const char* kToolProxyTokenHeader = "x-internal-tool-proxy-token";
constexpr const char* kForwardedHeader = "x-call-bridge-forwarded";

// Sends a webhook body to the worker that owns the call.
using ToolForwarder =
    std::function<RestResponse(const std::string& worker_address, const nlohmann::json& body)>;

ToolForwarder make_http_forwarder(std::optional<std::string> proxy_token,
                                  std::chrono::seconds timeout);

// Server-side tool calls and operator transfers for calls of this worker.
class ToolWebhook {
public:
    ToolWebhook(std::shared_ptr<registry::SessionRegistry> registry,
                std::optional<std::string> proxy_token,
                ToolForwarder forwarder,
                std::chrono::seconds tool_timeout = std::chrono::seconds(30));

    RestResponse handle_tools(const nlohmann::json& body,
                              const std::optional<std::string>& proxy_token,
                              bool forwarded) const;

    RestResponse handle_transfer(const nlohmann::json& body) const;

private:
    realtime::ToolResult wait_for(std::shared_ptr<call::ActiveCall> session,
                                  realtime::ToolCall call) const;

    std::shared_ptr<registry::SessionRegistry> registry_;
    std::optional<std::string> proxy_token_;
    ToolForwarder forwarder_;
    std::chrono::seconds tool_timeout_;
};

}
