#include "call_bridge/realtime/tool_call.hpp"

#include <initializer_list>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace realtime {

namespace {

const nlohmann::json* first_present(const nlohmann::json& object,
                                    std::initializer_list<const char*> keys) {
    if (!object.is_object()) {
        return nullptr;
    }
    for (const auto* key : keys) {
        auto it = object.find(key);
        if (it != object.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<std::string> scalar_string(const nlohmann::json* value) {
    if (!value) {
        return std::nullopt;
    }
    if (value->is_string()) {
        auto text = value->get<std::string>();
        if (text.empty()) {
            return std::nullopt;
        }
        return text;
    }
    if (value->is_number_integer()) {
        return value->dump();
    }
    return std::nullopt;
}

std::optional<std::string> extract_id(const nlohmann::json& container) {
    return scalar_string(first_present(container, {"id", "tool_call_id", "call_id", "callId"}));
}

nlohmann::json extract_flat_args(const nlohmann::json& container) {
    const auto* raw = first_present(
        container, {"arguments", "input", "payload", "parameters", "tool_arguments"});
    if (!raw) {
        return nlohmann::json::object();
    }
    return parse_tool_arguments(*raw);
}

std::optional<ToolCall> extract_nested_function(const nlohmann::json& container) {
    if (!container.is_object()) {
        return std::nullopt;
    }
    auto function_it = container.find("function");
    if (function_it == container.end() || !function_it->is_object()) {
        return std::nullopt;
    }
    auto id = extract_id(container);
    auto name = scalar_string(first_present(*function_it, {"name"}));
    if (!id || !name) {
        return std::nullopt;
    }
    ToolCall call;
    call.id = *id;
    call.name = *name;
    if (const auto* raw = first_present(*function_it, {"arguments"})) {
        call.args = parse_tool_arguments(*raw);
    } else {
        call.args = extract_flat_args(container);
    }
    return call;
}

std::optional<ToolCall> extract_flat(const nlohmann::json& container) {
    auto id = extract_id(container);
    auto name = scalar_string(first_present(container, {"name", "tool_name", "action"}));
    if (!id || !name) {
        return std::nullopt;
    }
    ToolCall call;
    call.id = *id;
    call.name = *name;
    call.args = extract_flat_args(container);
    return call;
}

std::optional<ToolCall> extract_wrapped(const nlohmann::json& raw) {
    const auto* container = first_present(raw, {"tool_call", "toolCall", "tool"});
    if (!container || !container->is_object()) {
        return std::nullopt;
    }
    if (auto call = extract_nested_function(*container)) {
        return call;
    }
    return extract_flat(*container);
}

bool is_single_call_event(const std::string& type) {
    return type == "response.tool_call" || type == "tool.call" ||
           type == "session.tool_call" || type == "response.function_call_arguments.done";
}

}

ToolResult ToolResult::success(nlohmann::json data) {
    ToolResult result;
    result.ok = true;
    result.data = std::move(data);
    return result;
}

ToolResult ToolResult::failure(std::string error, std::optional<nlohmann::json> details) {
    ToolResult result;
    result.ok = false;
    result.error = std::move(error);
    result.details = std::move(details);
    return result;
}

nlohmann::json ToolResult::to_json() const {
    if (ok) {
        return {{"success", true}, {"data", data}};
    }
    nlohmann::json payload = {{"success", false}, {"error", error}};
    if (details) {
        payload["details"] = *details;
    }
    return payload;
}

std::string ToolResult::serialize() const {
    return to_json().dump();
}

nlohmann::json parse_tool_arguments(const nlohmann::json& raw) {
    if (raw.is_object()) {
        return raw;
    }
    if (raw.is_string()) {
        const auto text = raw.get<std::string>();
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (parsed.is_discarded()) {
            logging::warn("Failed to parse tool arguments", {kv("arguments", text)});
            return nlohmann::json::object();
        }
        if (parsed.is_object()) {
            return parsed;
        }
    }
    return nlohmann::json::object();
}

ToolCallNormalizer::ToolCallNormalizer() {
    strategies_.emplace_back("wrapped", extract_wrapped);
    strategies_.emplace_back("nested_function", extract_nested_function);
    strategies_.emplace_back("flat", extract_flat);
}

std::optional<ToolCall> ToolCallNormalizer::normalize(const nlohmann::json& raw) const {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    for (const auto& strategy : strategies_) {
        if (auto call = strategy.second(raw)) {
            return call;
        }
    }
    return std::nullopt;
}

std::vector<ToolCall> ToolCallNormalizer::normalize_frame(const nlohmann::json& frame) const {
    std::vector<ToolCall> calls;
    if (!frame.is_object()) {
        return calls;
    }
    std::string type;
    auto type_it = frame.find("type");
    if (type_it != frame.end() && type_it->is_string()) {
        type = type_it->get<std::string>();
    }
    if (is_single_call_event(type)) {
        if (auto call = normalize(frame)) {
            calls.push_back(std::move(*call));
        } else {
            logging::warn("Tool call event without id or name", {kv("type", type)});
        }
    }
    for (const char* key : {"tool_calls", "toolCallList", "toolCalls"}) {
        auto it = frame.find(key);
        if (it == frame.end() || !it->is_array()) {
            continue;
        }
        for (const auto& raw : *it) {
            if (auto call = normalize(raw)) {
                calls.push_back(std::move(*call));
            } else {
                logging::warn("Dropping tool call without id or name", {kv("list", key)});
            }
        }
    }
    return calls;
}

}
}
