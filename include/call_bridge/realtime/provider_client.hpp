#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "call_bridge/backend/client.hpp"
#include "call_bridge/realtime/assistant_provisioner.hpp"

namespace call_bridge {
namespace realtime {

class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message, int status = 0)
        : std::runtime_error(message), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

// The id may sit at id, _id, assistant.id or data.id.
std::optional<std::string> extract_assistant_id(const nlohmann::json& response);

// Bare arrays or arrays under assistants, items or data.
nlohmann::json extract_assistant_list(const nlohmann::json& response);

// REST side of the AI provider: assistants and websocket calls.
class ProviderClient : public AssistantApi {
public:
    ProviderClient(std::shared_ptr<BackendClient> http, int sample_rate, std::string encoding);

    bool update(const std::string& assistant_id, const nlohmann::json& payload) override;
    std::optional<std::string> find_by_name(const std::string& name) override;
    std::string create(const nlohmann::json& payload) override;

    // Starts a websocket transport call; the response carries the URLs to dial.
    nlohmann::json create_call(const std::string& assistant_id, const std::string& call_id);

private:
    std::shared_ptr<BackendClient> http_;
    int sample_rate_;
    std::string encoding_;
};

}
}
