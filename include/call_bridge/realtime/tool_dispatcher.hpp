#pragma once

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/business/assistant_config.hpp"
#include "call_bridge/business/collaborators.hpp"
#include "call_bridge/realtime/tool_call.hpp"

namespace call_bridge {
namespace realtime {

struct ToolContext {
    std::string call_id;
    std::shared_ptr<const business::AssistantConfig> config;
};

struct ToolCollaborators {
    std::shared_ptr<business::Scheduling> scheduling;
    std::shared_ptr<business::Calendar> calendar;
    std::shared_ptr<business::CallTransfer> transfer;
};

// Maps legacy aliases onto the canonical tool names. Unknown names yield
// std::nullopt.
std::optional<std::string> canonical_tool_name(const std::string& name);

bool is_calendar_tool(const std::string& canonical_name);

std::vector<std::string> missing_arguments(const nlohmann::json& args,
                                           std::initializer_list<const char*> required);

std::string summarize_slots(const std::vector<std::string>& slots, int open_hour, int close_hour);

class ToolDispatcher {
public:
    ToolDispatcher(ToolCollaborators collaborators, std::string time_zone);

    // Never throws; every failure becomes an error envelope.
    ToolResult dispatch(const ToolCall& call, const ToolContext& context) const;

private:
    ToolResult dispatch_canonical(const std::string& name,
                                  const ToolCall& call,
                                  const ToolContext& context) const;
    ToolResult transfer_call(const ToolCall& call, const ToolContext& context) const;
    ToolResult check_availability(const ToolCall& call, const ToolContext& context) const;
    ToolResult schedule_event(const ToolCall& call, const ToolContext& context) const;
    ToolResult cancel_event(const ToolCall& call, const ToolContext& context) const;

    ToolCollaborators collaborators_;
    std::string time_zone_;
};

}
}
