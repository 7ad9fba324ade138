#pragma once

#include <memory>
#include <string>

#include <boost/asio/io_service.hpp>
#include <boost/asio/signal_set.hpp>

#include "call_bridge/backend/client.hpp"
#include "call_bridge/business/backend_collaborators.hpp"
#include "call_bridge/call/call_directory.hpp"
#include "call_bridge/call/call_session.hpp"
#include "call_bridge/config.hpp"
#include "call_bridge/realtime/gateway.hpp"
#include "call_bridge/realtime/tool_dispatcher.hpp"
#include "call_bridge/registry/session_registry.hpp"
#include "call_bridge/server/rest_server.hpp"
#include "call_bridge/server/tool_webhook.hpp"
#include "call_bridge/telephony/media_gateway.hpp"
#include "call_bridge/utils/scheduler.hpp"

namespace call_bridge {

namespace realtime {
class RealtimeClient;
}

class BridgeApp {
public:
    explicit BridgeApp(Config config);
    ~BridgeApp();

    void init();
    // Runs the io_service on the calling thread until stop().
    void run();
    void stop();
    const Config& config() const;

private:
    std::shared_ptr<telephony::CarrierStream> create_stream(
        const std::string& connection_id,
        const std::string& destination,
        std::shared_ptr<telephony::CarrierChannel> channel);
    std::shared_ptr<registry::SessionStore> make_session_store() const;

    Config config_;
    boost::asio::io_service io_;
    std::shared_ptr<BackendClient> backend_client_;
    std::shared_ptr<business::BackendCollaborators> collaborators_;
    std::shared_ptr<registry::SessionRegistry> registry_;
    std::shared_ptr<realtime::ToolDispatcher> dispatcher_;
    std::shared_ptr<utils::AsioScheduler> scheduler_;
    std::shared_ptr<realtime::RealtimeClient> realtime_client_;
    std::shared_ptr<realtime::RealtimeGateway> gateway_;
    std::unique_ptr<telephony::MediaGateway> media_gateway_;
    std::shared_ptr<ToolWebhook> webhook_;
    std::unique_ptr<RestServer> rest_server_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    call::CallDirectory calls_;
    bool stopped_ = false;
};

}
