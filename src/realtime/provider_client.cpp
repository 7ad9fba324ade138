#include "call_bridge/realtime/provider_client.hpp"

#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {
namespace realtime {

namespace {

std::optional<std::string> id_field(const nlohmann::json& object) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"id", "_id"}) {
        auto it = object.find(key);
        if (it != object.end() && it->is_string() && !it->get<std::string>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

}

std::optional<std::string> extract_assistant_id(const nlohmann::json& response) {
    if (auto id = id_field(response)) {
        return id;
    }
    if (!response.is_object()) {
        return std::nullopt;
    }
    for (const char* key : {"assistant", "data"}) {
        auto it = response.find(key);
        if (it != response.end()) {
            if (auto id = id_field(*it)) {
                return id;
            }
        }
    }
    return std::nullopt;
}

nlohmann::json extract_assistant_list(const nlohmann::json& response) {
    if (response.is_array()) {
        return response;
    }
    if (response.is_object()) {
        for (const char* key : {"assistants", "items", "data"}) {
            auto it = response.find(key);
            if (it != response.end() && it->is_array()) {
                return *it;
            }
        }
    }
    return nlohmann::json::array();
}

ProviderClient::ProviderClient(std::shared_ptr<BackendClient> http,
                               int sample_rate,
                               std::string encoding)
    : http_(std::move(http)), sample_rate_(sample_rate), encoding_(std::move(encoding)) {}

bool ProviderClient::update(const std::string& assistant_id, const nlohmann::json& payload) {
    try {
        http_->patch_json("/assistant/" + utils::url_encode(assistant_id), payload);
        return true;
    } catch (const BackendError& ex) {
        if (ex.status() == 404) {
            logging::warn("Assistant no longer exists", {kv("assistant_id", assistant_id)});
            return false;
        }
        throw ProviderError(std::string("Assistant update failed: ") + ex.what(), ex.status());
    }
}

std::optional<std::string> ProviderClient::find_by_name(const std::string& name) {
    nlohmann::json response;
    try {
        response = http_->get_json("/assistant?name=" + utils::url_encode(name));
    } catch (const BackendError& ex) {
        throw ProviderError(std::string("Assistant lookup failed: ") + ex.what(), ex.status());
    }
    for (const auto& item : extract_assistant_list(response)) {
        if (!item.is_object()) {
            continue;
        }
        auto it = item.find("name");
        if (it != item.end() && it->is_string() && it->get<std::string>() == name) {
            return id_field(item);
        }
    }
    return std::nullopt;
}

std::string ProviderClient::create(const nlohmann::json& payload) {
    nlohmann::json response;
    try {
        response = http_->post_json("/assistant", payload);
    } catch (const BackendError& ex) {
        throw ProviderError(std::string("Assistant create failed: ") + ex.what(), ex.status());
    }
    auto id = extract_assistant_id(response);
    if (!id) {
        throw ProviderError("Assistant create returned no id");
    }
    return *id;
}

nlohmann::json ProviderClient::create_call(const std::string& assistant_id,
                                           const std::string& call_id) {
    const nlohmann::json payload = {
        {"assistantId", assistant_id},
        {"transport", {
            {"provider", "vapi.websocket"},
            {"audioFormat", {
                {"format", encoding_},
                {"container", "raw"},
                {"sampleRate", sample_rate_},
            }},
        }},
        {"metadata", {{"callId", call_id}}},
    };
    try {
        return http_->post_json("/call", payload);
    } catch (const BackendError& ex) {
        throw ProviderError(std::string("Realtime call create failed: ") + ex.what(), ex.status());
    }
}

}
}
