#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace call_bridge {
namespace business {

// Days use ISO numbering, Monday = 1 .. Sunday = 7.
struct OpeningHours {
    int day_of_week = 1;
    bool is_open = false;
    std::string open_time;
    std::string close_time;
};

struct StaffAvailability {
    int day_of_week = 1;
    bool is_active = false;
    std::string start_time;
    std::string end_time;
};

struct StaffMember {
    std::string name;
    std::string role;
    std::vector<StaffAvailability> availability;
};

struct AppointmentType {
    std::string name;
    int duration_minutes = 0;
};

struct VoiceSettings {
    std::string voice_id;
    double talking_speed = 1.0;
    std::string welcome_phrase;
};

struct CompanyDetails {
    std::string name;
    std::string industry;
    std::string description;
};

struct CompanyContact {
    std::string website;
    std::string email;
    std::string phone;
    std::string address;
};

struct CompanyContext {
    std::optional<CompanyDetails> details;
    std::optional<CompanyContact> contact;
    std::vector<OpeningHours> hours;
    std::vector<std::string> info;
};

// Everything the assistant needs about the company, captured once when the
// call starts.
struct AssistantConfig {
    std::string company_id;
    std::string company_name;
    std::optional<std::string> assistant_id;
    std::string reply_style;
    CompanyContext context;
    std::vector<AppointmentType> appointment_types;
    std::vector<StaffMember> staff;
    bool calendar_enabled = false;
    std::optional<std::string> transfer_number;
    std::optional<VoiceSettings> voice;
};

struct DayHours {
    bool open = true;
    int open_hour = 9;
    int close_hour = 17;
};

// Throws std::invalid_argument when required fields are missing.
AssistantConfig assistant_config_from_json(const nlohmann::json& payload);

// ISO weekday of a YYYY-MM-DD date.
int iso_weekday(const std::string& iso_date);

// Opening hours for the weekday of the date. Days without an entry fall back
// to 9..17.
DayHours hours_for_date(const AssistantConfig& config, const std::string& iso_date);

}
}
