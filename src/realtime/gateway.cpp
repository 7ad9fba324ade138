#include "call_bridge/realtime/gateway.hpp"

#include <stdexcept>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/realtime/assistant_provisioner.hpp"
#include "call_bridge/realtime/provider_client.hpp"
#include "call_bridge/realtime/session_connector.hpp"
#include "call_bridge/realtime/ws_realtime_client.hpp"

namespace call_bridge {
namespace realtime {

void RealtimeGateway::remember_config(const std::string& call_id,
                                      std::shared_ptr<const business::AssistantConfig> config) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_[call_id] = std::move(config);
}

std::shared_ptr<const business::AssistantConfig> RealtimeGateway::config_for(
    const std::optional<std::string>& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (call_id && !call_id->empty()) {
        auto it = configs_.find(*call_id);
        return it == configs_.end() ? nullptr : it->second;
    }
    if (configs_.size() == 1) {
        return configs_.begin()->second;
    }
    return nullptr;
}

void RealtimeGateway::forget_config(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    configs_.erase(call_id);
}

size_t RealtimeGateway::config_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configs_.size();
}

ProviderRealtimeGateway::ProviderRealtimeGateway(std::shared_ptr<ProviderClient> provider,
                                                 std::shared_ptr<AssistantProvisioner> provisioner,
                                                 std::shared_ptr<RealtimeClient> client)
    : provider_(std::move(provider)),
      provisioner_(std::move(provisioner)),
      client_(std::move(client)) {}

std::unique_ptr<RealtimeSession> ProviderRealtimeGateway::open_session(
    const std::string& call_id,
    std::shared_ptr<const business::AssistantConfig> config,
    RealtimeCallbacks callbacks) {
    if (!config) {
        throw std::invalid_argument("Missing assistant configuration for call " + call_id);
    }
    remember_config(call_id, config);

    const auto assistant_id = provisioner_->ensure_assistant(*config);
    const auto response = provider_->create_call(assistant_id, call_id);
    const auto urls = extract_connection_urls(response);
    const std::string session_id =
        response.is_object() && response.contains("id") && response["id"].is_string()
            ? response["id"].get<std::string>()
            : call_id;
    logging::info("Realtime call created",
                  {kv("call_id", call_id),
                   kv("session_id", session_id),
                   kv("assistant_id", assistant_id),
                   kv("candidates", urls.size())});

    try {
        return connect_with_fallback(urls, [&](const std::string& url) {
            return client_->dial(url, call_id, session_id, callbacks);
        });
    } catch (const RealtimeConnectError&) {
        Metrics::instance().realtime_connect_failure();
        throw;
    }
}

}
}
