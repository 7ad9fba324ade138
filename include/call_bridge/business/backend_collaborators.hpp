#pragma once

#include <memory>

#include "call_bridge/backend/client.hpp"
#include "call_bridge/business/collaborators.hpp"

namespace call_bridge {
namespace business {

// Collaborators served by the business backend's internal REST API.
class BackendCollaborators : public CompanyLookup,
                             public Scheduling,
                             public Calendar,
                             public CallTransfer {
public:
    explicit BackendCollaborators(std::shared_ptr<BackendClient> client);

    std::optional<AssistantConfig> find_by_number(const std::string& number) override;

    std::vector<std::string> available_slots(const std::string& company_id,
                                             const std::string& date,
                                             int open_hour,
                                             int close_hour) override;

    nlohmann::json create_event(const std::string& company_id,
                                const nlohmann::json& event) override;
    nlohmann::json cancel_event(const std::string& company_id,
                                const nlohmann::json& request) override;

    nlohmann::json transfer(const std::string& call_id,
                            const std::string& phone_number,
                            const TransferOptions& options) override;

private:
    std::shared_ptr<BackendClient> client_;
};

}
}
