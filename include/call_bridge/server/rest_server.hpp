#pragma once

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "call_bridge/config.hpp"
#include "call_bridge/registry/session_registry.hpp"
#include "call_bridge/server/rest_response.hpp"
#include "call_bridge/server/tool_webhook.hpp"

namespace call_bridge {

class RestServer {
public:
    RestServer(const Config& config,
               std::shared_ptr<ToolWebhook> webhook,
               std::shared_ptr<registry::SessionRegistry> registry);

    void start();
    void stop();

private:
    bool authorize_request(const httplib::Request& request, httplib::Response& response) const;
    bool parse_body(const httplib::Request& request, httplib::Response& response,
                    nlohmann::json& body) const;
    void write_json(httplib::Response& response, const RestResponse& payload) const;

    const Config& config_;
    std::shared_ptr<ToolWebhook> webhook_;
    std::shared_ptr<registry::SessionRegistry> registry_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
