#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/business/assistant_config.hpp"

namespace call_bridge {
namespace business {

class CompanyLookup {
public:
    virtual ~CompanyLookup() = default;
    virtual std::optional<AssistantConfig> find_by_number(const std::string& number) = 0;
};

class Scheduling {
public:
    virtual ~Scheduling() = default;
    // Free slot start times ("HH:MM") between the opening hours of the date.
    virtual std::vector<std::string> available_slots(const std::string& company_id,
                                                     const std::string& date,
                                                     int open_hour,
                                                     int close_hour) = 0;
};

class Calendar {
public:
    virtual ~Calendar() = default;
    virtual nlohmann::json create_event(const std::string& company_id,
                                        const nlohmann::json& event) = 0;
    virtual nlohmann::json cancel_event(const std::string& company_id,
                                        const nlohmann::json& request) = 0;
};

struct TransferOptions {
    std::optional<std::string> caller_id;
    std::optional<std::string> reason;
};

class CallTransfer {
public:
    virtual ~CallTransfer() = default;
    virtual nlohmann::json transfer(const std::string& call_id,
                                    const std::string& phone_number,
                                    const TransferOptions& options) = 0;
};

}
}
