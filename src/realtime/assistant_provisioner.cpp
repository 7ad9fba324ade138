#include "call_bridge/realtime/assistant_provisioner.hpp"

#include <sstream>
#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace realtime {

namespace {

const char* const kDayNames[] = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};

const char* day_name(int iso_day) {
    if (iso_day < 1 || iso_day > 7) {
        return "Unknown day";
    }
    return kDayNames[iso_day - 1];
}

const char* action_label(AssistantActionKind kind) {
    switch (kind) {
        case AssistantActionKind::UseCached:
            return "cached";
        case AssistantActionKind::UpdateFound:
            return "updated";
        case AssistantActionKind::Create:
            return "created";
    }
    return "unknown";
}

nlohmann::json string_property(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json function_tool(const std::string& name,
                             const std::string& description,
                             nlohmann::json properties,
                             nlohmann::json required) {
    return {
        {"type", "function"},
        {"function", {
            {"name", name},
            {"description", description},
            {"parameters", {
                {"type", "object"},
                {"properties", std::move(properties)},
                {"required", std::move(required)},
            }},
        }},
    };
}

void append_company_section(std::ostringstream& out, const business::AssistantConfig& config) {
    out << "You are the phone assistant of " << config.company_name << ".\n";
    const auto& context = config.context;
    if (context.details) {
        out << "\nCompany details:\n";
        if (!context.details->name.empty()) {
            out << "- Name: " << context.details->name << "\n";
        }
        if (!context.details->industry.empty()) {
            out << "- Industry: " << context.details->industry << "\n";
        }
        if (!context.details->description.empty()) {
            out << "- Description: " << context.details->description << "\n";
        }
    }
    if (context.contact) {
        out << "\nContact:\n";
        const auto& contact = *context.contact;
        if (!contact.website.empty()) {
            out << "- Website: " << contact.website << "\n";
        }
        if (!contact.email.empty()) {
            out << "- Email: " << contact.email << "\n";
        }
        if (!contact.phone.empty()) {
            out << "- Phone: " << contact.phone << "\n";
        }
        if (!contact.address.empty()) {
            out << "- Address: " << contact.address << "\n";
        }
    }
    if (!context.hours.empty()) {
        out << "\nOpening hours:\n";
        for (const auto& hours : context.hours) {
            out << "- " << day_name(hours.day_of_week) << ": ";
            if (hours.is_open) {
                out << hours.open_time << " - " << hours.close_time << "\n";
            } else {
                out << "closed\n";
            }
        }
    }
    if (!context.info.empty()) {
        out << "\nGeneral information:\n";
        for (const auto& line : context.info) {
            out << "- " << line << "\n";
        }
    }
}

void append_services_section(std::ostringstream& out, const business::AssistantConfig& config) {
    if (!config.appointment_types.empty()) {
        out << "\nAppointment types:\n";
        for (const auto& type : config.appointment_types) {
            out << "- " << type.name << " (" << type.duration_minutes << " minutes)\n";
        }
    }
    if (!config.staff.empty()) {
        out << "\nStaff:\n";
        for (const auto& member : config.staff) {
            out << "- " << member.name;
            if (!member.role.empty()) {
                out << " (" << member.role << ")";
            }
            out << "\n";
            for (const auto& slot : member.availability) {
                if (slot.is_active) {
                    out << "  - " << day_name(slot.day_of_week) << ": " << slot.start_time
                        << " - " << slot.end_time << "\n";
                }
            }
        }
    }
}

}

AssistantAction decide_assistant_action(bool cached_id_valid,
                                        const std::optional<std::string>& looked_up_id) {
    if (cached_id_valid) {
        return {AssistantActionKind::UseCached, ""};
    }
    if (looked_up_id && !looked_up_id->empty()) {
        return {AssistantActionKind::UpdateFound, *looked_up_id};
    }
    return {AssistantActionKind::Create, ""};
}

std::string assistant_name(const business::AssistantConfig& config) {
    return "company-" + config.company_id + "-assistant";
}

std::string build_instructions(const business::AssistantConfig& config) {
    std::ostringstream out;
    append_company_section(out, config);
    append_services_section(out, config);

    if (!config.reply_style.empty()) {
        out << "\nReply style: " << config.reply_style << "\n";
    }
    if (config.voice && !config.voice->welcome_phrase.empty()) {
        out << "\nOpen the conversation with: \"" << config.voice->welcome_phrase << "\"\n";
    }

    out << "\n";
    if (config.calendar_enabled) {
        out << "You can manage appointments. Always check availability with "
               "check_google_calendar_availability before proposing a time. Ask for the "
               "caller's name and date of birth before scheduling with "
               "schedule_google_calendar_event, and use cancel_google_calendar_event to "
               "cancel an existing appointment.\n";
    } else {
        out << "You cannot book or cancel appointments. Offer to take a message or refer the "
               "caller to the contact details instead.\n";
    }
    if (config.transfer_number) {
        out << "When the caller asks for a person, use transfer_call with phoneNumber "
            << *config.transfer_number << ".\n";
    }
    return out.str();
}

nlohmann::json build_tool_definitions(const business::AssistantConfig& config) {
    nlohmann::json tools = nlohmann::json::array();
    if (config.calendar_enabled) {
        tools.push_back(function_tool(
            "check_google_calendar_availability",
            "List free appointment times for a date.",
            {{"date", string_property("Date as YYYY-MM-DD")}},
            {"date"}));
        tools.push_back(function_tool(
            "schedule_google_calendar_event",
            "Book an appointment in the company calendar.",
            {
                {"summary", string_property("Short title of the appointment")},
                {"start", string_property("Start as ISO-8601 date-time")},
                {"end", string_property("End as ISO-8601 date-time")},
                {"name", string_property("Full name of the caller")},
                {"dateOfBirth", string_property("Date of birth of the caller")},
                {"description", string_property("Extra notes")},
                {"location", string_property("Location of the appointment")},
                {"attendeeEmail", string_property("Email address of the caller")},
            },
            {"summary", "start", "end", "name", "dateOfBirth"}));
        tools.push_back(function_tool(
            "cancel_google_calendar_event",
            "Cancel an appointment by event id or by name, date of birth and date.",
            {
                {"eventId", string_property("Id of the calendar event")},
                {"name", string_property("Full name of the caller")},
                {"dateOfBirth", string_property("Date of birth of the caller")},
                {"date", string_property("Date of the appointment as YYYY-MM-DD")},
            },
            nlohmann::json::array()));
    }
    if (config.transfer_number) {
        tools.push_back(function_tool(
            "transfer_call",
            "Transfer the caller to a person.",
            {
                {"phoneNumber", string_property("Number to transfer to")},
                {"reason", string_property("Why the caller is transferred")},
            },
            {"phoneNumber"}));
    }
    return tools;
}

nlohmann::json build_assistant_payload(const business::AssistantConfig& config) {
    nlohmann::json payload = {
        {"name", assistant_name(config)},
        {"model", {
            {"provider", "openai"},
            {"model", "gpt-4o"},
            {"messages", nlohmann::json::array({
                {{"role", "system"}, {"content", build_instructions(config)}},
            })},
            {"tools", build_tool_definitions(config)},
        }},
        {"metadata", {{"companyId", config.company_id}}},
    };
    if (config.voice) {
        if (!config.voice->voice_id.empty()) {
            payload["voice"] = {
                {"provider", "vapi"},
                {"voiceId", config.voice->voice_id},
                {"speed", config.voice->talking_speed},
            };
        }
        if (!config.voice->welcome_phrase.empty()) {
            payload["firstMessage"] = config.voice->welcome_phrase;
        }
    }
    return payload;
}

AssistantProvisioner::AssistantProvisioner(std::shared_ptr<AssistantApi> api)
    : api_(std::move(api)) {}

std::string AssistantProvisioner::ensure_assistant(const business::AssistantConfig& config) {
    const auto payload = build_assistant_payload(config);

    std::optional<std::string> cached = cached_id(config.company_id);
    if (!cached) {
        cached = config.assistant_id;
    }

    const bool cached_valid = cached && !cached->empty() && api_->update(*cached, payload);
    std::optional<std::string> looked_up;
    if (!cached_valid) {
        looked_up = api_->find_by_name(assistant_name(config));
    }

    const auto action = decide_assistant_action(cached_valid, looked_up);
    std::string assistant_id;
    switch (action.kind) {
        case AssistantActionKind::UseCached:
            assistant_id = *cached;
            break;
        case AssistantActionKind::UpdateFound:
            assistant_id = action.assistant_id;
            if (!api_->update(assistant_id, payload)) {
                assistant_id = api_->create(payload);
            }
            break;
        case AssistantActionKind::Create:
            assistant_id = api_->create(payload);
            break;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[config.company_id] = assistant_id;
    }
    logging::info("Assistant ready",
                  {kv("company_id", config.company_id),
                   kv("assistant_id", assistant_id),
                   kv("action", action_label(action.kind))});
    return assistant_id;
}

std::optional<std::string> AssistantProvisioner::cached_id(const std::string& company_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(company_id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}
}
