#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "call_bridge/business/assistant_config.hpp"
#include "call_bridge/realtime/event_router.hpp"
#include "call_bridge/realtime/realtime_session.hpp"

namespace call_bridge {
namespace realtime {

class AssistantProvisioner;
class ProviderClient;
class RealtimeClient;

// Opens AI sessions and keeps each call's configuration snapshot apart.
class RealtimeGateway {
public:
    virtual ~RealtimeGateway() = default;

    // Throws on provisioning or connect failure.
    virtual std::unique_ptr<RealtimeSession> open_session(
        const std::string& call_id,
        std::shared_ptr<const business::AssistantConfig> config,
        RealtimeCallbacks callbacks) = 0;

    void remember_config(const std::string& call_id,
                         std::shared_ptr<const business::AssistantConfig> config);

    // Without a call id the only live snapshot is returned; with several live
    // calls there is no fallback.
    std::shared_ptr<const business::AssistantConfig> config_for(
        const std::optional<std::string>& call_id) const;

    void forget_config(const std::string& call_id);
    size_t config_count() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<const business::AssistantConfig>> configs_;
};

class ProviderRealtimeGateway : public RealtimeGateway {
public:
    ProviderRealtimeGateway(std::shared_ptr<ProviderClient> provider,
                            std::shared_ptr<AssistantProvisioner> provisioner,
                            std::shared_ptr<RealtimeClient> client);

    std::unique_ptr<RealtimeSession> open_session(
        const std::string& call_id,
        std::shared_ptr<const business::AssistantConfig> config,
        RealtimeCallbacks callbacks) override;

private:
    std::shared_ptr<ProviderClient> provider_;
    std::shared_ptr<AssistantProvisioner> provisioner_;
    std::shared_ptr<RealtimeClient> client_;
};

}
}
