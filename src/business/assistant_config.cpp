#include "call_bridge/business/assistant_config.hpp"

#include <stdexcept>

#include "call_bridge/utils/text.hpp"

namespace call_bridge {
namespace business {

namespace {

std::string string_field(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) {
        return "";
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_number()) {
        return it->dump();
    }
    return "";
}

std::optional<std::string> optional_string(const nlohmann::json& object, const char* key) {
    auto value = string_field(object, key);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

int int_field(const nlohmann::json& object, const char* key, int fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_number()) {
        return fallback;
    }
    return it->get<int>();
}

bool bool_field(const nlohmann::json& object, const char* key, bool fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

const nlohmann::json& array_field(const nlohmann::json& object, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    auto it = object.find(key);
    if (it == object.end() || !it->is_array()) {
        return empty;
    }
    return *it;
}

std::optional<int> parse_hour(const std::string& time) {
    const auto colon = time.find(':');
    const auto hour_text = time.substr(0, colon);
    if (hour_text.empty() || hour_text.size() > 2) {
        return std::nullopt;
    }
    for (char ch : hour_text) {
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
    }
    const int hour = std::stoi(hour_text);
    if (hour < 0 || hour > 24) {
        return std::nullopt;
    }
    return hour;
}

CompanyContext parse_context(const nlohmann::json& context) {
    CompanyContext result;
    if (!context.is_object()) {
        return result;
    }
    auto details_it = context.find("details");
    if (details_it != context.end() && details_it->is_object()) {
        result.details = CompanyDetails{string_field(*details_it, "name"),
                                        string_field(*details_it, "industry"),
                                        string_field(*details_it, "description")};
    }
    auto contact_it = context.find("contact");
    if (contact_it != context.end() && contact_it->is_object()) {
        CompanyContact contact;
        contact.website = string_field(*contact_it, "website");
        contact.email = string_field(*contact_it, "contact_email");
        if (contact.email.empty()) {
            contact.email = string_field(*contact_it, "email");
        }
        contact.phone = string_field(*contact_it, "phone");
        contact.address = string_field(*contact_it, "address");
        result.contact = contact;
    }
    for (const auto& item : array_field(context, "hours")) {
        OpeningHours hours;
        hours.day_of_week = int_field(item, "dayOfWeek", 1);
        hours.is_open = bool_field(item, "isOpen", false);
        hours.open_time = string_field(item, "openTime");
        hours.close_time = string_field(item, "closeTime");
        result.hours.push_back(hours);
    }
    for (const auto& item : array_field(context, "info")) {
        if (item.is_string()) {
            result.info.push_back(item.get<std::string>());
        } else {
            auto value = string_field(item, "value");
            if (!value.empty()) {
                result.info.push_back(value);
            }
        }
    }
    return result;
}

}

AssistantConfig assistant_config_from_json(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw std::invalid_argument("Assistant config must be a JSON object");
    }
    AssistantConfig config;
    config.company_id = string_field(payload, "companyId");
    if (config.company_id.empty()) {
        throw std::invalid_argument("Assistant config is missing companyId");
    }
    config.company_name = string_field(payload, "companyName");
    config.assistant_id = optional_string(payload, "assistantId");

    auto style_it = payload.find("replyStyle");
    if (style_it != payload.end()) {
        config.reply_style = style_it->is_object() ? string_field(*style_it, "description")
                                                   : string_field(payload, "replyStyle");
    }

    auto context_it = payload.find("context");
    if (context_it != payload.end()) {
        config.context = parse_context(*context_it);
    }

    for (const auto& item : array_field(payload, "appointmentTypes")) {
        config.appointment_types.push_back(
            AppointmentType{string_field(item, "name"), int_field(item, "duration", 0)});
    }
    for (const auto& item : array_field(payload, "staffMembers")) {
        StaffMember member;
        member.name = string_field(item, "name");
        member.role = string_field(item, "role");
        for (const auto& slot : array_field(item, "availability")) {
            StaffAvailability availability;
            availability.day_of_week = int_field(slot, "dayOfWeek", 1);
            availability.is_active = bool_field(slot, "isActive", false);
            availability.start_time = string_field(slot, "startTime");
            availability.end_time = string_field(slot, "endTime");
            member.availability.push_back(availability);
        }
        config.staff.push_back(member);
    }

    config.calendar_enabled = bool_field(payload, "calendarEnabled", false);
    config.transfer_number = optional_string(payload, "transferNumber");

    auto voice_it = payload.find("voice");
    if (voice_it != payload.end() && voice_it->is_object()) {
        VoiceSettings voice;
        voice.voice_id = string_field(*voice_it, "voiceId");
        auto speed_it = voice_it->find("talkingSpeed");
        if (speed_it != voice_it->end() && speed_it->is_number()) {
            voice.talking_speed = speed_it->get<double>();
        }
        voice.welcome_phrase = string_field(*voice_it, "welcomePhrase");
        config.voice = voice;
    }
    return config;
}

int iso_weekday(const std::string& iso_date) {
    if (!utils::is_iso_date(iso_date)) {
        throw std::invalid_argument("Expected a YYYY-MM-DD date: " + iso_date);
    }
    static const int offsets[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
    int year = std::stoi(iso_date.substr(0, 4));
    const int month = std::stoi(iso_date.substr(5, 2));
    const int day = std::stoi(iso_date.substr(8, 2));
    if (month < 3) {
        year -= 1;
    }
    const int sunday_based = (year + year / 4 - year / 100 + year / 400 +
                              offsets[month - 1] + day) % 7;
    return sunday_based == 0 ? 7 : sunday_based;
}

DayHours hours_for_date(const AssistantConfig& config, const std::string& iso_date) {
    DayHours result;
    const int weekday = iso_weekday(iso_date);
    for (const auto& hours : config.context.hours) {
        if (hours.day_of_week != weekday) {
            continue;
        }
        if (!hours.is_open) {
            result.open = false;
            return result;
        }
        const auto open_hour = parse_hour(hours.open_time);
        const auto close_hour = parse_hour(hours.close_time);
        if (open_hour && close_hour && *open_hour < *close_hour) {
            result.open_hour = *open_hour;
            result.close_hour = *close_hour;
        }
        return result;
    }
    return result;
}

}
}
