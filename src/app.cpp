#include "call_bridge/app.hpp"

#include <chrono>
#include <csignal>
#include <utility>
#include <vector>

#include "call_bridge/logging.hpp"
#include "call_bridge/realtime/assistant_provisioner.hpp"
#include "call_bridge/realtime/provider_client.hpp"
#include "call_bridge/realtime/ws_realtime_client.hpp"
#include "call_bridge/registry/session_store.hpp"
#include "call_bridge/utils/executor.hpp"

namespace call_bridge {

namespace {

BackendRequestOptions backend_options(const Config& config) {
    return {std::chrono::seconds(static_cast<int>(config.backend_request_timeout)),
            std::chrono::seconds(static_cast<int>(config.backend_connect_timeout)),
            std::chrono::seconds(static_cast<int>(config.backend_sock_read_timeout))};
}

}

BridgeApp::BridgeApp(Config config)
    : config_(std::move(config)),
      backend_client_(std::make_shared<BackendClient>(config_.backend_url,
                                                      config_.authorization_token,
                                                      backend_options(config_))),
      collaborators_(std::make_shared<business::BackendCollaborators>(backend_client_)),
      scheduler_(std::make_shared<utils::AsioScheduler>(io_)) {
    registry::RegistryOptions registry_options;
    registry_options.worker_id = config_.worker_id;
    registry_options.worker_address = config_.worker_address;
    registry_options.ttl = std::chrono::seconds(config_.registry_ttl_sec);
    registry_ = std::make_shared<registry::SessionRegistry>(registry_options, make_session_store());

    realtime::ToolCollaborators tools;
    tools.scheduling = collaborators_;
    tools.calendar = collaborators_;
    tools.transfer = collaborators_;
    dispatcher_ = std::make_shared<realtime::ToolDispatcher>(tools, config_.calendar_time_zone);

    auto provider_http = std::make_shared<BackendClient>(
        config_.provider_api_url, config_.provider_api_key, backend_options(config_));
    auto provider = std::make_shared<realtime::ProviderClient>(
        provider_http, config_.audio_sample_rate, config_.audio_encoding);
    auto provisioner = std::make_shared<realtime::AssistantProvisioner>(provider);

    realtime::RealtimeClientOptions client_options;
    client_options.api_key = config_.provider_api_key;
    client_options.connect_timeout = std::chrono::milliseconds(config_.realtime_connect_timeout_ms);
    realtime_client_ = std::make_shared<realtime::RealtimeClient>(io_, client_options);
    gateway_ = std::make_shared<realtime::ProviderRealtimeGateway>(provider, provisioner,
                                                                   realtime_client_);

    webhook_ = std::make_shared<ToolWebhook>(
        registry_, config_.tool_proxy_token,
        make_http_forwarder(config_.tool_proxy_token,
                            std::chrono::seconds(static_cast<int>(config_.backend_request_timeout))));
}

BridgeApp::~BridgeApp() {
    stop();
}

void BridgeApp::init() {
    const auto stale = registry_->clear_worker(config_.worker_id);
    if (stale > 0) {
        logging::info("Cleared stale sessions of this worker",
                      {kv("worker_id", config_.worker_id), kv("removed", stale)});
    }

    media_gateway_ = std::make_unique<telephony::MediaGateway>(
        io_, config_,
        [this](const std::string& connection_id, const std::string& destination,
               std::shared_ptr<telephony::CarrierChannel> channel) {
            return create_stream(connection_id, destination, std::move(channel));
        });
    media_gateway_->start();

    rest_server_ = std::make_unique<RestServer>(config_, webhook_, registry_);
    rest_server_->start();

    signals_ = std::make_unique<boost::asio::signal_set>(io_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        logging::info("Shutdown signal received", {kv("signal", signal_number)});
        stop();
    });
}

void BridgeApp::run() {
    io_.run();
}

void BridgeApp::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;

    for (const auto& call : calls_.snapshot()) {
        call->teardown("server shutdown");
    }

    if (media_gateway_) {
        media_gateway_->stop();
    }
    if (rest_server_) {
        rest_server_->stop();
    }
    if (signals_) {
        boost::system::error_code ec;
        signals_->cancel(ec);
    }
    io_.stop();
}

const Config& BridgeApp::config() const {
    return config_;
}

std::shared_ptr<telephony::CarrierStream> BridgeApp::create_stream(
    const std::string& connection_id,
    const std::string& destination,
    std::shared_ptr<telephony::CarrierChannel> channel) {
    call::CallDependencies deps;
    deps.company_lookup = collaborators_;
    deps.gateway = gateway_;
    deps.registry = registry_;
    deps.dispatcher = dispatcher_;
    deps.scheduler = scheduler_;

    call::CallOptions options;
    options.vad = config_.vad;
    options.interruptions_allowed = config_.interruptions_are_allowed;
    options.keepalive_interval = std::chrono::milliseconds(config_.keepalive_interval_ms);

    auto session = std::make_shared<call::CallSession>(
        destination, std::move(channel),
        std::make_shared<utils::SerialExecutor>("call-" + connection_id), deps, options);
    const call::CallSession* raw = session.get();
    session->set_on_finished([this, raw](const std::string& call_id) {
        calls_.remove(call_id, raw);
    });

    return std::make_shared<telephony::CarrierStream>(
        connection_id,
        [this, session](const telephony::CarrierEvent& start)
            -> std::shared_ptr<telephony::CarrierEventSink> {
            calls_.add(start.call_id, session);
            session->start(start.call_id, start.stream_id);
            return session;
        });
}

std::shared_ptr<registry::SessionStore> BridgeApp::make_session_store() const {
    if (config_.registry_store_path) {
        logging::info("Session registry persisted",
                      {kv("path", config_.registry_store_path->string())});
        return std::make_shared<registry::JsonFileSessionStore>(*config_.registry_store_path);
    }
    return std::make_shared<registry::MemorySessionStore>();
}

}
