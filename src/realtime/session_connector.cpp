#include "call_bridge/realtime/session_connector.hpp"

#include <algorithm>
#include <deque>
#include <set>
#include <sstream>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace realtime {

namespace {

std::string describe(const std::vector<ConnectAttempt>& attempts) {
    if (attempts.empty()) {
        return "Realtime connect failed: no connection URL";
    }
    std::ostringstream out;
    out << "Realtime connect failed after " << attempts.size() << " attempt(s)";
    for (const auto& attempt : attempts) {
        out << "; " << attempt.url << ": " << attempt.cause;
    }
    return out.str();
}

void add_url(std::vector<std::string>& urls, const nlohmann::json& value) {
    if (!value.is_string()) {
        return;
    }
    const auto url = value.get<std::string>();
    if (url.empty() || std::find(urls.begin(), urls.end(), url) != urls.end()) {
        return;
    }
    urls.push_back(url);
}

const nlohmann::json* member(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return nullptr;
    }
    auto it = object.find(key);
    return it == object.end() ? nullptr : &*it;
}

}

DialResult DialResult::connected(std::unique_ptr<RealtimeSession> session) {
    DialResult result;
    result.status = Status::Connected;
    result.session = std::move(session);
    return result;
}

DialResult DialResult::redirect(std::string url) {
    DialResult result;
    result.status = Status::Redirect;
    result.redirect_url = std::move(url);
    return result;
}

DialResult DialResult::failed(std::string error) {
    DialResult result;
    result.status = Status::Failed;
    result.error = std::move(error);
    return result;
}

RealtimeConnectError::RealtimeConnectError(std::vector<ConnectAttempt> attempts)
    : std::runtime_error(describe(attempts)), attempts_(std::move(attempts)) {}

std::vector<std::string> extract_connection_urls(const nlohmann::json& response) {
    std::vector<std::string> urls;
    const auto* transport = member(response, "transport");
    if (transport) {
        if (const auto* url = member(*transport, "websocketCallUrl")) {
            add_url(urls, *url);
        }
    }
    if (const auto* url = member(response, "websocketCallUrl")) {
        add_url(urls, *url);
    }
    if (transport) {
        if (const auto* url = member(*transport, "url")) {
            add_url(urls, *url);
        }
    }
    if (const auto* list = member(response, "urls")) {
        if (list->is_array()) {
            for (const auto& url : *list) {
                add_url(urls, url);
            }
        }
    }
    if (const auto* url = member(response, "url")) {
        add_url(urls, *url);
    }
    return urls;
}

std::unique_ptr<RealtimeSession> connect_with_fallback(const std::vector<std::string>& candidates,
                                                       const Dialer& dialer) {
    std::deque<std::string> pending(candidates.begin(), candidates.end());
    std::set<std::string> visited;
    std::vector<ConnectAttempt> attempts;

    while (!pending.empty()) {
        const std::string url = pending.front();
        pending.pop_front();
        if (url.empty() || !visited.insert(url).second) {
            continue;
        }

        DialResult result;
        try {
            result = dialer(url);
        } catch (const std::exception& ex) {
            result = DialResult::failed(ex.what());
        }

        switch (result.status) {
            case DialResult::Status::Connected:
                if (result.session) {
                    if (!attempts.empty()) {
                        logging::info("Realtime connected after fallback",
                                      {kv("url", url), kv("failed_attempts", attempts.size())});
                    }
                    return std::move(result.session);
                }
                attempts.push_back({url, "dialer returned no session"});
                break;
            case DialResult::Status::Redirect:
                attempts.push_back({url, "redirected to " + result.redirect_url});
                if (!result.redirect_url.empty() && visited.count(result.redirect_url) == 0) {
                    pending.push_front(result.redirect_url);
                }
                break;
            case DialResult::Status::Failed:
                attempts.push_back({url, result.error.empty() ? "unknown error" : result.error});
                break;
        }
        logging::warn("Realtime dial failed",
                      {kv("url", url), kv("cause", attempts.back().cause)});
    }

    throw RealtimeConnectError(std::move(attempts));
}

}
}
