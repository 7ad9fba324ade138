#include "call_bridge/server/tool_webhook.hpp"

#include <atomic>
#include <future>
#include <utility>
#include <vector>

#include <httplib.h>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {

namespace {

RestResponse message_response(int status, const std::string& message) {
    return {status, {{"message", message}}};
}

std::optional<std::string> string_at(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto it = object.find(key);
    if (it == object.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::optional<std::string> webhook_call_id(const nlohmann::json& message) {
    auto call = message.find("call");
    if (call != message.end()) {
        if (auto id = string_at(*call, "id")) {
            return id;
        }
    }
    if (auto id = string_at(message, "callId")) {
        return id;
    }
    return string_at(message, "callSid");
}

std::vector<realtime::ToolCall> webhook_tool_calls(const nlohmann::json& message) {
    realtime::ToolCallNormalizer normalizer;
    std::vector<realtime::ToolCall> calls;
    for (const char* key : {"toolCallList", "toolCalls", "tool_calls"}) {
        auto it = message.find(key);
        if (it == message.end() || !it->is_array()) {
            continue;
        }
        for (const auto& item : *it) {
            if (auto call = normalizer.normalize(item)) {
                calls.push_back(std::move(*call));
            }
        }
        break;
    }
    return calls;
}

std::string next_transfer_id() {
    static std::atomic<unsigned long> counter{0};
    return "operator-transfer-" + std::to_string(++counter);
}

}

ToolForwarder make_http_forwarder(std::optional<std::string> proxy_token,
                                  std::chrono::seconds timeout) {
    return [proxy_token = std::move(proxy_token), timeout](const std::string& worker_address,
                                                           const nlohmann::json& body) {
        std::string scheme;
        std::string host;
        int port = 0;
        std::string base_path;
        utils::parse_url(worker_address, scheme, host, port, base_path);

        httplib::Client client(host, port);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        httplib::Headers headers{{kForwardedHeader, "1"}};
        if (proxy_token) {
            headers.emplace(kToolProxyTokenHeader, *proxy_token);
        }

        const auto path = base_path.empty() || base_path == "/" ? "/tools" : base_path + "/tools";
        auto response = client.Post(path.c_str(), headers, body.dump(), "application/json");
        if (!response) {
            logging::error("Tool webhook forward failed",
                           {kv("worker", worker_address),
                            kv("error", httplib::to_string(response.error()))});
            return message_response(502, "Owning worker unreachable");
        }
        auto parsed = nlohmann::json::parse(response->body, nullptr, false);
        if (parsed.is_discarded()) {
            parsed = {{"message", response->body}};
        }
        logging::info("Tool webhook forwarded",
                      {kv("worker", worker_address), kv("status", response->status)});
        return RestResponse{response->status, parsed};
    };
}

ToolWebhook::ToolWebhook(std::shared_ptr<registry::SessionRegistry> registry,
                         std::optional<std::string> proxy_token,
                         ToolForwarder forwarder,
                         std::chrono::seconds tool_timeout)
    : registry_(std::move(registry)),
      proxy_token_(std::move(proxy_token)),
      forwarder_(std::move(forwarder)),
      tool_timeout_(tool_timeout) {}

RestResponse ToolWebhook::handle_tools(const nlohmann::json& body,
                                       const std::optional<std::string>& proxy_token,
                                       bool forwarded) const {
    if (proxy_token_ && (!proxy_token || *proxy_token != *proxy_token_)) {
        logging::warn("Tool webhook rejected: invalid proxy token");
        return message_response(403, "invalid tool proxy token");
    }
    if (!body.is_object()) {
        return message_response(400, "invalid request body");
    }

    const auto& message =
        body.contains("message") && body["message"].is_object() ? body["message"] : body;
    const auto call_id = webhook_call_id(message);
    const auto calls = webhook_tool_calls(message);
    if (calls.empty()) {
        return message_response(400, "no tool calls");
    }

    std::shared_ptr<call::ActiveCall> session;
    if (call_id) {
        session = registry_->find_by_ai_session_id(*call_id);
    }
    if (!session) {
        const auto resolved = registry_->resolve_active_session(call_id);
        if (resolved.status == registry::Resolution::Ambiguous) {
            return message_response(409, "several calls are active, call id required");
        }
        if (resolved.status == registry::Resolution::Found) {
            session = resolved.session;
        }
    }
    if (!session && call_id && !forwarded && forwarder_) {
        const auto remote = registry_->find_remote(*call_id);
        if (remote && remote->worker_address) {
            logging::info("Forwarding tool webhook",
                          {kv("call_id", *call_id), kv("worker_id", remote->worker_id)});
            return forwarder_(*remote->worker_address, body);
        }
    }
    if (!session) {
        logging::warn("Tool webhook for unknown call", {kv("call_id", call_id)});
        return message_response(404, "call not found");
    }

    nlohmann::json results = nlohmann::json::array();
    for (const auto& call : calls) {
        const auto result = wait_for(session, call);
        results.push_back({{"toolCallId", call.id}, {"result", result.serialize()}});
    }
    return {200, {{"results", results}}};
}

RestResponse ToolWebhook::handle_transfer(const nlohmann::json& body) const {
    if (!body.is_object()) {
        return message_response(400, "invalid request body");
    }
    const auto phone_number = string_at(body, "phoneNumber");
    if (!phone_number) {
        return message_response(400, "phoneNumber is required");
    }
    const auto call_sid = string_at(body, "callSid");

    const auto resolved = registry_->resolve_active_session(call_sid);
    if (resolved.status == registry::Resolution::Ambiguous) {
        return message_response(409, "several calls are active, callSid required");
    }
    if (resolved.status != registry::Resolution::Found) {
        return message_response(409, "no active call to transfer");
    }

    nlohmann::json args = {{"phoneNumber", *phone_number}};
    for (const char* key : {"callerId", "reason"}) {
        if (auto value = string_at(body, key)) {
            args[key] = *value;
        }
    }
    const auto result =
        wait_for(resolved.session, realtime::ToolCall{next_transfer_id(), "transfer_call", args});
    logging::info("Operator transfer handled",
                  {kv("call_id", resolved.call_id), kv("success", result.ok)});
    return {200, result.to_json()};
}

realtime::ToolResult ToolWebhook::wait_for(std::shared_ptr<call::ActiveCall> session,
                                           realtime::ToolCall call) const {
    const auto id = call.id;
    auto future = session->submit_tool_call(std::move(call));
    if (future.wait_for(tool_timeout_) != std::future_status::ready) {
        logging::error("Tool call timed out",
                       {kv("call_id", session->call_id()), kv("tool_call_id", id)});
        return realtime::ToolResult::failure("Tool call timed out");
    }
    return future.get();
}

}
