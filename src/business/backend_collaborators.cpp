#include "call_bridge/business/backend_collaborators.hpp"

#include <utility>

#include "call_bridge/logging.hpp"
#include "call_bridge/utils/http.hpp"

namespace call_bridge {
namespace business {

namespace {

std::string company_path(const std::string& company_id, const std::string& suffix) {
    return "/internal/companies/" + utils::url_encode(company_id) + suffix;
}

}

BackendCollaborators::BackendCollaborators(std::shared_ptr<BackendClient> client)
    : client_(std::move(client)) {}

std::optional<AssistantConfig> BackendCollaborators::find_by_number(const std::string& number) {
    nlohmann::json payload;
    try {
        payload = client_->get_json("/internal/companies/by-number/" + utils::url_encode(number));
    } catch (const BackendError& ex) {
        if (ex.status() == 404) {
            logging::info("No company registered for number", {kv("number", number)});
            return std::nullopt;
        }
        throw;
    }
    if (payload.is_null() || (payload.is_object() && payload.empty())) {
        return std::nullopt;
    }
    return assistant_config_from_json(payload);
}

std::vector<std::string> BackendCollaborators::available_slots(const std::string& company_id,
                                                               const std::string& date,
                                                               int open_hour,
                                                               int close_hour) {
    const nlohmann::json body = {
        {"date", date},
        {"openHour", open_hour},
        {"closeHour", close_hour},
    };
    const auto response = client_->post_json(company_path(company_id, "/calendar/availability"),
                                             body);
    const auto& slots = response.is_object() && response.contains("slots")
                            ? response.at("slots")
                            : response;
    std::vector<std::string> result;
    if (!slots.is_array()) {
        throw BackendError("Availability response has no slot list", 0, response.dump());
    }
    for (const auto& slot : slots) {
        if (slot.is_string()) {
            result.push_back(slot.get<std::string>());
        }
    }
    return result;
}

nlohmann::json BackendCollaborators::create_event(const std::string& company_id,
                                                  const nlohmann::json& event) {
    return client_->post_json(company_path(company_id, "/calendar/events"), event);
}

nlohmann::json BackendCollaborators::cancel_event(const std::string& company_id,
                                                  const nlohmann::json& request) {
    return client_->post_json(company_path(company_id, "/calendar/events/cancel"), request);
}

nlohmann::json BackendCollaborators::transfer(const std::string& call_id,
                                              const std::string& phone_number,
                                              const TransferOptions& options) {
    nlohmann::json body = {{"phoneNumber", phone_number}};
    if (options.caller_id) {
        body["callerId"] = *options.caller_id;
    }
    if (options.reason) {
        body["reason"] = *options.reason;
    }
    return client_->post_json("/internal/calls/" + utils::url_encode(call_id) + "/transfer", body);
}

}
}
