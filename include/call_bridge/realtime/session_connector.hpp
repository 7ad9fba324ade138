#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/realtime/realtime_session.hpp"

namespace call_bridge {
namespace realtime {

struct DialResult {
    enum class Status {
        Connected,
        Redirect,
        Failed,
    };

    Status status = Status::Failed;
    std::unique_ptr<RealtimeSession> session;
    std::string redirect_url;
    std::string error;

    static DialResult connected(std::unique_ptr<RealtimeSession> session);
    static DialResult redirect(std::string url);
    static DialResult failed(std::string error);
};

using Dialer = std::function<DialResult(const std::string& url)>;

struct ConnectAttempt {
    std::string url;
    std::string cause;
};

class RealtimeConnectError : public std::runtime_error {
public:
    explicit RealtimeConnectError(std::vector<ConnectAttempt> attempts);

    const std::vector<ConnectAttempt>& attempts() const { return attempts_; }

private:
    std::vector<ConnectAttempt> attempts_;
};

// Candidate websocket URLs from a create-call response, in preference order
// and without duplicates.
std::vector<std::string> extract_connection_urls(const nlohmann::json& response);

// Dials candidates in order. A redirect is followed once per distinct URL.
// Throws RealtimeConnectError when nothing connects.
std::unique_ptr<RealtimeSession> connect_with_fallback(const std::vector<std::string>& candidates,
                                                       const Dialer& dialer);

}
}
