#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace call_bridge {
namespace realtime {

struct ToolCall {
    std::string id;
    std::string name;
    nlohmann::json args = nlohmann::json::object();
};

// Envelope returned to the AI provider for every tool call.
struct ToolResult {
    bool ok = false;
    nlohmann::json data;
    std::string error;
    std::optional<nlohmann::json> details;

    static ToolResult success(nlohmann::json data);
    static ToolResult failure(std::string error,
                              std::optional<nlohmann::json> details = std::nullopt);

    nlohmann::json to_json() const;
    std::string serialize() const;
};

// Strings are parsed as JSON. Anything that does not end up as an object
// becomes an empty object.
nlohmann::json parse_tool_arguments(const nlohmann::json& raw);

class ToolCallNormalizer {
public:
    using Strategy = std::function<std::optional<ToolCall>(const nlohmann::json&)>;

    ToolCallNormalizer();

    // First strategy that yields a call with both id and name wins.
    std::optional<ToolCall> normalize(const nlohmann::json& raw) const;

    // Every call carried by a provider frame: the frame itself for the
    // single-call event types, plus each entry of tool_calls / toolCallList.
    std::vector<ToolCall> normalize_frame(const nlohmann::json& frame) const;

    const std::vector<std::pair<std::string, Strategy>>& strategies() const { return strategies_; }

private:
    std::vector<std::pair<std::string, Strategy>> strategies_;
};

}
}
