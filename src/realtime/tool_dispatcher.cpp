#include "call_bridge/realtime/tool_dispatcher.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <map>
#include <sstream>
#include <utility>

#include "call_bridge/backend/client.hpp"
#include "call_bridge/logging.hpp"
#include "call_bridge/metrics.hpp"
#include "call_bridge/utils/text.hpp"

namespace call_bridge {
namespace realtime {

namespace {

const std::map<std::string, std::string>& tool_aliases() {
    static const std::map<std::string, std::string> aliases = {
        {"transfer_call", "transfer_call"},
        {"transfer", "transfer_call"},
        {"transferCall", "transfer_call"},
        {"check_google_calendar_availability", "check_google_calendar_availability"},
        {"check_calendar_availability", "check_google_calendar_availability"},
        {"schedule_google_calendar_event", "schedule_google_calendar_event"},
        {"create_calendar_event", "schedule_google_calendar_event"},
        {"cancel_google_calendar_event", "cancel_google_calendar_event"},
        {"cancel_calendar_event", "cancel_google_calendar_event"},
    };
    return aliases;
}

bool has_value(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return false;
    }
    if (it->is_string()) {
        return !utils::trim(it->get<std::string>()).empty();
    }
    return true;
}

std::string string_arg(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return utils::trim(it->get<std::string>());
    }
    return it->dump();
}

std::optional<std::string> optional_arg(const nlohmann::json& args, const char* key) {
    if (!has_value(args, key)) {
        return std::nullopt;
    }
    return string_arg(args, key);
}

nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

ToolResult missing_result(const std::vector<std::string>& missing) {
    std::ostringstream message;
    message << "Missing required argument(s): ";
    for (size_t i = 0; i < missing.size(); ++i) {
        if (i > 0) {
            message << ", ";
        }
        message << missing[i];
    }
    return ToolResult::failure(message.str());
}

ToolResult backend_failure(const BackendError& ex) {
    std::optional<nlohmann::json> details;
    std::string message = ex.what();
    if (!ex.body().empty()) {
        auto parsed = nlohmann::json::parse(ex.body(), nullptr, false);
        if (!parsed.is_discarded()) {
            details = parsed;
            if (parsed.is_object()) {
                for (const char* key : {"message", "error"}) {
                    auto it = parsed.find(key);
                    if (it != parsed.end() && it->is_string() && !it->get<std::string>().empty()) {
                        message = it->get<std::string>();
                        break;
                    }
                }
            }
        }
    }
    return ToolResult::failure(message, details);
}

std::string two_digits(int value) {
    std::ostringstream out;
    if (value < 10) {
        out << '0';
    }
    out << value;
    return out.str();
}

}

std::optional<std::string> canonical_tool_name(const std::string& name) {
    const auto& aliases = tool_aliases();
    auto it = aliases.find(name);
    if (it == aliases.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool is_calendar_tool(const std::string& canonical_name) {
    return canonical_name == "check_google_calendar_availability" ||
           canonical_name == "schedule_google_calendar_event" ||
           canonical_name == "cancel_google_calendar_event";
}

std::vector<std::string> missing_arguments(const nlohmann::json& args,
                                           std::initializer_list<const char*> required) {
    std::vector<std::string> missing;
    for (const auto* key : required) {
        if (!has_value(args, key)) {
            missing.emplace_back(key);
        }
    }
    return missing;
}

std::string summarize_slots(const std::vector<std::string>& slots, int open_hour, int close_hour) {
    if (slots.empty()) {
        return "No free times between " + std::to_string(open_hour) + " and " +
               std::to_string(close_hour) + ".";
    }
    const int total_slots = std::max(0, (close_hour - open_hour) * 2);
    std::ostringstream out;
    if (static_cast<int>(slots.size()) >= total_slots - 2) {
        std::vector<std::string> busy;
        for (int hour = open_hour; hour < close_hour; ++hour) {
            for (const char* minutes : {":00", ":30"}) {
                const auto slot = two_digits(hour) + minutes;
                if (std::find(slots.begin(), slots.end(), slot) == slots.end()) {
                    busy.push_back(slot);
                }
            }
        }
        out << "Available all day between " << open_hour << " and " << close_hour;
        if (!busy.empty()) {
            out << ", except at ";
            for (size_t i = 0; i < busy.size(); ++i) {
                if (i > 0) {
                    out << " and ";
                }
                out << busy[i];
            }
        }
        out << ".";
        return out.str();
    }
    out << "Available times: ";
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) {
            out << ", ";
        }
        out << slots[i];
    }
    out << ".";
    return out.str();
}

ToolDispatcher::ToolDispatcher(ToolCollaborators collaborators, std::string time_zone)
    : collaborators_(std::move(collaborators)),
      time_zone_(std::move(time_zone)) {}

ToolResult ToolDispatcher::dispatch(const ToolCall& call, const ToolContext& context) const {
    const auto started = std::chrono::steady_clock::now();
    const auto canonical = canonical_tool_name(call.name);
    const std::string metric_name = canonical ? *canonical : "unknown";

    ToolResult result;
    if (!canonical) {
        logging::warn("Unknown tool requested",
                      {kv("call_id", context.call_id), kv("tool", call.name)});
        result = ToolResult::failure("Unknown tool: " + call.name);
    } else {
        try {
            result = dispatch_canonical(*canonical, call, context);
        } catch (const BackendError& ex) {
            logging::error("Tool collaborator failed",
                           {kv("call_id", context.call_id),
                            kv("tool", *canonical),
                            kv("status", ex.status()),
                            kv("error", ex.what())});
            result = backend_failure(ex);
        } catch (const std::exception& ex) {
            logging::error("Tool handler failed",
                           {kv("call_id", context.call_id),
                            kv("tool", *canonical),
                            kv("error", ex.what())});
            result = ToolResult::failure(ex.what());
        }
    }

    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    Metrics::instance().observe_tool_call(metric_name, result.ok, elapsed);
    logging::info("Tool call handled",
                  {kv("call_id", context.call_id),
                   kv("tool_call_id", call.id),
                   kv("tool", metric_name),
                   kv("success", result.ok)});
    return result;
}

ToolResult ToolDispatcher::dispatch_canonical(const std::string& name,
                                              const ToolCall& call,
                                              const ToolContext& context) const {
    if (!context.config) {
        return ToolResult::failure("Call is not configured");
    }
    if (is_calendar_tool(name) && !context.config->calendar_enabled) {
        return ToolResult::failure("Calendar integration not available");
    }
    if (name == "transfer_call") {
        return transfer_call(call, context);
    }
    if (name == "check_google_calendar_availability") {
        return check_availability(call, context);
    }
    if (name == "schedule_google_calendar_event") {
        return schedule_event(call, context);
    }
    return cancel_event(call, context);
}

ToolResult ToolDispatcher::transfer_call(const ToolCall& call, const ToolContext& context) const {
    const auto missing = missing_arguments(call.args, {"phoneNumber"});
    if (!missing.empty()) {
        return missing_result(missing);
    }
    const auto raw_number = string_arg(call.args, "phoneNumber");
    const auto number = utils::normalize_phone_number(raw_number);
    if (!number) {
        return ToolResult::failure("Invalid phone number: " + raw_number);
    }
    if (!collaborators_.transfer) {
        return ToolResult::failure("Call transfer is not available for this call");
    }

    business::TransferOptions options;
    options.caller_id = optional_arg(call.args, "callerId");
    options.reason = optional_arg(call.args, "reason");
    const auto call_sid = optional_arg(call.args, "callSid").value_or(context.call_id);

    const auto response = collaborators_.transfer->transfer(call_sid, *number, options);

    // The collaborator's fields win; ours only fill the gaps.
    nlohmann::json data = response.is_object() ? response : nlohmann::json::object();
    const nlohmann::json defaults = {
        {"message", "Transfer started"},
        {"transferredTo", *number},
        {"callSid", call_sid},
        {"reason", optional_to_json(options.reason)},
    };
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
        }
    }
    return ToolResult::success(data);
}

ToolResult ToolDispatcher::check_availability(const ToolCall& call,
                                              const ToolContext& context) const {
    const auto missing = missing_arguments(call.args, {"date"});
    if (!missing.empty()) {
        return missing_result(missing);
    }
    const auto date = string_arg(call.args, "date");
    if (!utils::is_iso_date(date)) {
        return ToolResult::failure("Invalid date, expected YYYY-MM-DD: " + date);
    }

    const auto hours = business::hours_for_date(*context.config, date);
    if (!hours.open) {
        return ToolResult::success({
            {"date", date},
            {"open", false},
            {"slots", nlohmann::json::array()},
            {"summary", "Closed on this day."},
        });
    }
    if (!collaborators_.scheduling) {
        return ToolResult::failure("Calendar integration not available");
    }

    const auto slots = collaborators_.scheduling->available_slots(
        context.config->company_id, date, hours.open_hour, hours.close_hour);
    return ToolResult::success({
        {"date", date},
        {"openHour", hours.open_hour},
        {"closeHour", hours.close_hour},
        {"slots", slots},
        {"summary", summarize_slots(slots, hours.open_hour, hours.close_hour)},
    });
}

ToolResult ToolDispatcher::schedule_event(const ToolCall& call, const ToolContext& context) const {
    const auto missing =
        missing_arguments(call.args, {"summary", "start", "end", "name", "dateOfBirth"});
    if (!missing.empty()) {
        return missing_result(missing);
    }
    if (!collaborators_.calendar) {
        return ToolResult::failure("Calendar integration not available");
    }

    const auto name = string_arg(call.args, "name");
    const auto date_of_birth = string_arg(call.args, "dateOfBirth");
    std::string description = "Name: " + name + "\nDate of birth: " + date_of_birth;
    if (auto extra = optional_arg(call.args, "description")) {
        description += "\n" + *extra;
    }

    nlohmann::json event = {
        {"summary", string_arg(call.args, "summary")},
        {"description", description},
        {"start", {{"dateTime", string_arg(call.args, "start")}, {"timeZone", time_zone_}}},
        {"end", {{"dateTime", string_arg(call.args, "end")}, {"timeZone", time_zone_}}},
        {"transparency", "opaque"},
        {"status", "confirmed"},
    };
    if (auto location = optional_arg(call.args, "location")) {
        event["location"] = *location;
    }
    if (auto email = optional_arg(call.args, "attendeeEmail")) {
        event["attendees"] = nlohmann::json::array({{{"email", *email}, {"displayName", name}}});
    }

    const auto created = collaborators_.calendar->create_event(context.config->company_id, event);
    return ToolResult::success({{"event", created}});
}

ToolResult ToolDispatcher::cancel_event(const ToolCall& call, const ToolContext& context) const {
    nlohmann::json request;
    if (has_value(call.args, "eventId")) {
        request = {{"eventId", string_arg(call.args, "eventId")}};
    } else {
        const auto missing = missing_arguments(call.args, {"name", "dateOfBirth", "date"});
        if (!missing.empty()) {
            return missing_result(missing);
        }
        request = {
            {"name", string_arg(call.args, "name")},
            {"dateOfBirth", string_arg(call.args, "dateOfBirth")},
            {"date", string_arg(call.args, "date")},
        };
    }
    if (!collaborators_.calendar) {
        return ToolResult::failure("Calendar integration not available");
    }

    const auto response = collaborators_.calendar->cancel_event(context.config->company_id, request);
    nlohmann::json data = {{"cancelled", true}};
    if (response.is_object()) {
        auto cancelled = response.find("cancelled");
        if (cancelled != response.end() && cancelled->is_boolean()) {
            data["cancelled"] = *cancelled;
        }
        auto event_id = response.find("eventId");
        if (event_id != response.end() && event_id->is_string()) {
            data["eventId"] = *event_id;
        }
    } else if (response.is_boolean()) {
        data["cancelled"] = response.get<bool>();
    }
    if (!data.contains("eventId") && request.contains("eventId")) {
        data["eventId"] = request["eventId"];
    }
    return ToolResult::success(data);
}

}
}
