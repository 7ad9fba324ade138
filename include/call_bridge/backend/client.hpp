#pragma once

#include <chrono>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace call_bridge {

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& message, int status = 0, std::string body = "")
        : std::runtime_error(message), status_(status), body_(std::move(body)) {}

    int status() const { return status_; }
    const std::string& body() const { return body_; }

private:
    int status_;
    std::string body_;
};

class BackendPermissionError : public BackendError {
public:
    explicit BackendPermissionError(const std::string& message, std::string body = "")
        : BackendError(message, 403, std::move(body)) {}
};

struct BackendRequestOptions {
    std::chrono::seconds request_timeout{30};
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds sock_read_timeout{30};
};

// JSON over HTTP(S) with an optional bearer token.
class BackendClient {
public:
    BackendClient(std::string base_url,
                  std::optional<std::string> authorization_token,
                  BackendRequestOptions options);

    void set_default_header(const std::string& name, const std::string& value);

    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json put_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json patch_json(const std::string& path, const nlohmann::json& body);
    nlohmann::json delete_json(const std::string& path);

    const std::string& base_url() const { return base_url_; }

private:
    nlohmann::json request(const char* method, const std::string& path,
                           const std::optional<nlohmann::json>& body);
    httplib::Headers build_headers(bool has_body) const;
    std::string build_path(const std::string& path) const;

    std::string base_url_;
    std::string scheme_;
    std::string host_;
    int port_ = 0;
    std::string base_path_;
    std::optional<std::string> authorization_token_;
    BackendRequestOptions options_;
    httplib::Headers default_headers_;
    std::unique_ptr<httplib::Client> client_;
};

}
