#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/business/assistant_config.hpp"

namespace call_bridge {
namespace realtime {

// Remote assistant resources on the AI provider.
class AssistantApi {
public:
    virtual ~AssistantApi() = default;

    // False when the id no longer exists.
    virtual bool update(const std::string& assistant_id, const nlohmann::json& payload) = 0;
    virtual std::optional<std::string> find_by_name(const std::string& name) = 0;
    virtual std::string create(const nlohmann::json& payload) = 0;
};

enum class AssistantActionKind {
    UseCached,
    UpdateFound,
    Create,
};

struct AssistantAction {
    AssistantActionKind kind = AssistantActionKind::Create;
    std::string assistant_id;
};

AssistantAction decide_assistant_action(bool cached_id_valid,
                                        const std::optional<std::string>& looked_up_id);

std::string assistant_name(const business::AssistantConfig& config);
std::string build_instructions(const business::AssistantConfig& config);
nlohmann::json build_tool_definitions(const business::AssistantConfig& config);
nlohmann::json build_assistant_payload(const business::AssistantConfig& config);

class AssistantProvisioner {
public:
    explicit AssistantProvisioner(std::shared_ptr<AssistantApi> api);

    // Returns the id of an assistant that matches the snapshot, creating one
    // only when neither the cached id nor a lookup by name resolves.
    std::string ensure_assistant(const business::AssistantConfig& config);

    std::optional<std::string> cached_id(const std::string& company_id) const;

private:
    std::shared_ptr<AssistantApi> api_;
    mutable std::mutex mutex_;
    std::map<std::string, std::string> cache_;
};

}
}
