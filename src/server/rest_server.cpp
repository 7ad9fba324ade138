#include "call_bridge/server/rest_server.hpp"

#include <optional>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"

namespace call_bridge {

RestServer::RestServer(const Config& config,
                       std::shared_ptr<ToolWebhook> webhook,
                       std::shared_ptr<registry::SessionRegistry> registry)
    : config_(config),
      webhook_(std::move(webhook)),
      registry_(std::move(registry)) {}

void RestServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{
            {"status", "ok"},
            {"activeCalls", registry_->active_count()},
            {"workerId", config_.worker_id},
        };
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    server_->Post("/tools", [this](const httplib::Request& req, httplib::Response& res) {
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }
        std::optional<std::string> token;
        if (req.has_header(kToolProxyTokenHeader)) {
            token = req.get_header_value(kToolProxyTokenHeader);
        }
        const bool forwarded = req.has_header(kForwardedHeader);
        try {
            write_json(res, webhook_->handle_tools(body, token, forwarded));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /tools request",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"tool call failed"})", "application/json");
        }
    });

    server_->Post("/transfer", [this](const httplib::Request& req, httplib::Response& res) {
        if (!authorize_request(req, res)) {
            return;
        }
        nlohmann::json body;
        if (!parse_body(req, res, body)) {
            return;
        }
        try {
            write_json(res, webhook_->handle_transfer(body));
        } catch (const std::exception& ex) {
            logging::error(
                "Failed to handle /transfer request",
                {kv("error", ex.what())});
            res.status = 500;
            res.set_content(R"({"message":"transfer failed"})", "application/json");
        }
    });

    server_thread_ = std::thread([this]() {
        logging::info(
            "REST server listening",
            {kv("port", config_.rest_api_port)});
        if (!server_->listen("0.0.0.0", config_.rest_api_port)) {
            logging::error("REST server stopped listening", {kv("port", config_.rest_api_port)});
        }
    });
}

void RestServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

bool RestServer::authorize_request(const httplib::Request& request,
                                   httplib::Response& response) const {
    if (!config_.authorization_token) {
        return true;
    }
    if (!request.has_header("Authorization")) {
        response.status = 401;
        response.set_content(R"({"message":"missing authorization"})", "application/json");
        return false;
    }
    const auto expected = "Bearer " + *config_.authorization_token;
    if (request.get_header_value("Authorization") != expected) {
        response.status = 403;
        response.set_content(R"({"message":"invalid authorization"})", "application/json");
        return false;
    }
    return true;
}

bool RestServer::parse_body(const httplib::Request& request, httplib::Response& response,
                            nlohmann::json& body) const {
    if (request.body.empty()) {
        body = nlohmann::json::object();
        return true;
    }
    try {
        body = nlohmann::json::parse(request.body);
    } catch (const std::exception& ex) {
        logging::error(
            "Failed to parse request body",
            {kv("path", request.path), kv("error", ex.what())});
        response.status = 400;
        response.set_content(R"({"message":"invalid request body"})", "application/json");
        return false;
    }
    return true;
}

void RestServer::write_json(httplib::Response& response, const RestResponse& payload) const {
    response.status = payload.status;
    response.set_content(payload.body.dump(), "application/json");
}

}
