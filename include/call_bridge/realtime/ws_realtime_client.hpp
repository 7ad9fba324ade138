#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/io_service.hpp>

#include "call_bridge/realtime/event_router.hpp"
#include "call_bridge/realtime/session_connector.hpp"

namespace call_bridge {
namespace realtime {

struct RealtimeClientOptions {
    std::string api_key;
    std::chrono::milliseconds connect_timeout{10000};
};

// http(s) URLs become ws(s); ws(s) URLs are returned unchanged.
std::string to_websocket_url(const std::string& url);

// websocketpp client endpoints (plain and TLS) on the shared io_service. Each
// dial yields one RealtimeSession whose frames are routed through an
// EventRouter into the given callbacks.
class RealtimeClient {
public:
    RealtimeClient(boost::asio::io_service& io, RealtimeClientOptions options);
    ~RealtimeClient();

    RealtimeClient(const RealtimeClient&) = delete;
    RealtimeClient& operator=(const RealtimeClient&) = delete;

    // Blocks the calling thread until the handshake settles or the connect
    // timeout elapses. Must not be called on the io_service thread.
    DialResult dial(const std::string& url,
                    const std::string& call_id,
                    const std::string& session_id,
                    RealtimeCallbacks callbacks);

private:
    struct Endpoints;

    boost::asio::io_service& io_;
    RealtimeClientOptions options_;
    std::unique_ptr<Endpoints> endpoints_;
};

}
}
