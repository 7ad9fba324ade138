#include "call_bridge/backend/client.hpp"

#include <cstring>
#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {

namespace {

constexpr size_t kErrorSnippetLimit = 256;

std::string error_snippet(const std::string& body) {
    return body.substr(0, kErrorSnippetLimit);
}

}

BackendClient::BackendClient(std::string base_url,
                             std::optional<std::string> authorization_token,
                             BackendRequestOptions options)
    : base_url_(std::move(base_url)),
      authorization_token_(std::move(authorization_token)),
      options_(options) {
    utils::parse_url(base_url_, scheme_, host_, port_, base_path_);
    if (host_.empty()) {
        throw BackendError("Backend URL has no host: " + base_url_);
    }
    if (base_path_ == "/") {
        base_path_.clear();
    }
    if (scheme_ == "https") {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_ = std::make_unique<httplib::Client>(utils::build_url(scheme_, host_, port_, ""));
        client_->enable_server_certificate_verification(false);
#else
        throw BackendError("HTTPS backend requires CPPHTTPLIB_OPENSSL_SUPPORT");
#endif
    } else {
        client_ = std::make_unique<httplib::Client>(host_, port_);
    }
    client_->set_connection_timeout(options_.connect_timeout);
    client_->set_read_timeout(options_.sock_read_timeout);
    client_->set_write_timeout(options_.request_timeout);
}

void BackendClient::set_default_header(const std::string& name, const std::string& value) {
    default_headers_.erase(name);
    default_headers_.emplace(name, value);
}

nlohmann::json BackendClient::get_json(const std::string& path) {
    return request("GET", path, std::nullopt);
}

nlohmann::json BackendClient::post_json(const std::string& path, const nlohmann::json& body) {
    return request("POST", path, body);
}

nlohmann::json BackendClient::put_json(const std::string& path, const nlohmann::json& body) {
    return request("PUT", path, body);
}

nlohmann::json BackendClient::patch_json(const std::string& path, const nlohmann::json& body) {
    return request("PATCH", path, body);
}

nlohmann::json BackendClient::delete_json(const std::string& path) {
    return request("DELETE", path, std::nullopt);
}

nlohmann::json BackendClient::request(const char* method, const std::string& path,
                                      const std::optional<nlohmann::json>& body) {
    const auto full_path = build_path(path);
    const auto headers = build_headers(body.has_value());
    const std::string payload = body ? body->dump() : std::string();

    auto send = [&]() -> httplib::Result {
        if (std::strcmp(method, "GET") == 0) {
            return client_->Get(full_path, headers);
        }
        if (std::strcmp(method, "POST") == 0) {
            return client_->Post(full_path, headers, payload, "application/json");
        }
        if (std::strcmp(method, "PUT") == 0) {
            return client_->Put(full_path, headers, payload, "application/json");
        }
        if (std::strcmp(method, "PATCH") == 0) {
            return client_->Patch(full_path, headers, payload, "application/json");
        }
        return client_->Delete(full_path, headers);
    };
    auto response = send();

    if (!response) {
        throw BackendError(std::string(method) + " " + full_path + " failed: " +
                           httplib::to_string(response.error()));
    }
    if (response->status == 403) {
        throw BackendPermissionError(error_snippet(response->body), response->body);
    }
    if (response->status < 200 || response->status >= 300) {
        logging::warn("Backend request rejected",
                      {kv("method", method),
                       kv("path", full_path),
                       kv("status", response->status),
                       kv("response", error_snippet(response->body))});
        throw BackendError(std::string(method) + " " + full_path + " returned " +
                               std::to_string(response->status),
                           response->status, response->body);
    }
    if (response->body.empty()) {
        return nlohmann::json::object();
    }
    auto parsed = nlohmann::json::parse(response->body, nullptr, false);
    if (parsed.is_discarded()) {
        throw BackendError("Backend returned invalid JSON for " + full_path,
                           response->status, response->body);
    }
    return parsed;
}

httplib::Headers BackendClient::build_headers(bool has_body) const {
    httplib::Headers headers = default_headers_;
    headers.emplace("Accept", "application/json");
    if (has_body) {
        headers.emplace("Content-Type", "application/json");
    }
    if (authorization_token_) {
        headers.emplace("Authorization", "Bearer " + *authorization_token_);
    }
    return headers;
}

std::string BackendClient::build_path(const std::string& path) const {
    if (base_path_.empty()) {
        return path;
    }
    if (path.empty()) {
        return base_path_;
    }
    if (base_path_.back() == '/' && path.front() == '/') {
        return base_path_ + path.substr(1);
    }
    if (base_path_.back() != '/' && path.front() != '/') {
        return base_path_ + "/" + path;
    }
    return base_path_ + path;
}

}
