#include <catch2/catch_test_macros.hpp>

#include "call_bridge/realtime/assistant_provisioner.hpp"
#include "call_bridge/realtime/provider_client.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace call_bridge;
using nlohmann::json;

namespace {

class FakeAssistantApi : public realtime::AssistantApi {
public:
    std::map<std::string, std::string> by_name;
    std::vector<std::string> existing;
    std::vector<std::string> updated;
    int created = 0;

    bool update(const std::string& assistant_id, const json&) override {
        for (const auto& id : existing) {
            if (id == assistant_id) {
                updated.push_back(assistant_id);
                return true;
            }
        }
        return false;
    }

    std::optional<std::string> find_by_name(const std::string& name) override {
        auto it = by_name.find(name);
        if (it == by_name.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string create(const json& payload) override {
        ++created;
        const auto id = "asst-new-" + std::to_string(created);
        existing.push_back(id);
        by_name[payload.at("name").get<std::string>()] = id;
        return id;
    }
};

business::AssistantConfig make_config() {
    business::AssistantConfig config;
    config.company_id = "42";
    config.company_name = "Dental Care";
    config.reply_style = "Friendly and brief.";
    config.context.hours.push_back({1, true, "09:00", "17:00"});
    config.context.hours.push_back({7, false, "", ""});
    config.context.info.push_back("Parking behind the building.");
    config.appointment_types.push_back({"Check-up", 30});
    return config;
}

bool has_tool(const json& tools, const std::string& name) {
    for (const auto& tool : tools) {
        if (tool.at("function").at("name") == name) {
            return true;
        }
    }
    return false;
}

}

TEST_CASE("decision prefers the cached id, then the lookup, then create") {
    auto action = realtime::decide_assistant_action(true, std::string("found"));
    REQUIRE(action.kind == realtime::AssistantActionKind::UseCached);

    action = realtime::decide_assistant_action(false, std::string("found"));
    REQUIRE(action.kind == realtime::AssistantActionKind::UpdateFound);
    REQUIRE(action.assistant_id == "found");

    action = realtime::decide_assistant_action(false, std::nullopt);
    REQUIRE(action.kind == realtime::AssistantActionKind::Create);

    action = realtime::decide_assistant_action(false, std::string(""));
    REQUIRE(action.kind == realtime::AssistantActionKind::Create);
}

TEST_CASE("ensure_assistant never creates a duplicate") {
    auto api = std::make_shared<FakeAssistantApi>();
    realtime::AssistantProvisioner provisioner(api);
    auto config = make_config();

    const auto first = provisioner.ensure_assistant(config);
    REQUIRE(api->created == 1);
    REQUIRE(provisioner.cached_id("42") == first);

    const auto second = provisioner.ensure_assistant(config);
    REQUIRE(second == first);
    REQUIRE(api->created == 1);
    REQUIRE(api->updated.size() == 1);

    realtime::AssistantProvisioner fresh(api);
    REQUIRE(fresh.ensure_assistant(config) == first);
    REQUIRE(api->created == 1);
}

TEST_CASE("stale snapshot id falls back to the lookup by name") {
    auto api = std::make_shared<FakeAssistantApi>();
    api->existing.push_back("asst-live");
    api->by_name[realtime::assistant_name(make_config())] = "asst-live";
    realtime::AssistantProvisioner provisioner(api);

    auto config = make_config();
    config.assistant_id = "asst-deleted";

    REQUIRE(provisioner.ensure_assistant(config) == "asst-live");
    REQUIRE(api->created == 0);
}

TEST_CASE("tools follow the calendar and transfer settings") {
    auto config = make_config();
    REQUIRE(realtime::build_tool_definitions(config).empty());

    config.calendar_enabled = true;
    auto tools = realtime::build_tool_definitions(config);
    REQUIRE(tools.size() == 3);
    REQUIRE(has_tool(tools, "check_google_calendar_availability"));
    REQUIRE_FALSE(has_tool(tools, "transfer_call"));

    config.transfer_number = "+31201234567";
    tools = realtime::build_tool_definitions(config);
    REQUIRE(has_tool(tools, "transfer_call"));
}

TEST_CASE("payload carries instructions, voice and first message") {
    auto config = make_config();
    config.voice = business::VoiceSettings{"voice-7", 1.1, "Hello, Dental Care speaking."};

    const auto payload = realtime::build_assistant_payload(config);
    REQUIRE(payload.at("name") == "company-42-assistant");
    REQUIRE(payload.at("firstMessage") == "Hello, Dental Care speaking.");
    REQUIRE(payload.at("voice").at("voiceId") == "voice-7");

    const auto instructions =
        payload.at("model").at("messages").at(0).at("content").get<std::string>();
    REQUIRE(instructions.find("Dental Care") != std::string::npos);
    REQUIRE(instructions.find("Monday: 09:00 - 17:00") != std::string::npos);
    REQUIRE(instructions.find("Sunday: closed") != std::string::npos);
    REQUIRE(instructions.find("Check-up (30 minutes)") != std::string::npos);
    REQUIRE(instructions.find("cannot book") != std::string::npos);
}

TEST_CASE("assistant ids and lists are read from every response shape") {
    REQUIRE(realtime::extract_assistant_id(json{{"id", "a"}}) == std::string("a"));
    REQUIRE(realtime::extract_assistant_id(json{{"_id", "b"}}) == std::string("b"));
    REQUIRE(realtime::extract_assistant_id(json{{"assistant", {{"id", "c"}}}}) == std::string("c"));
    REQUIRE(realtime::extract_assistant_id(json{{"data", {{"id", "d"}}}}) == std::string("d"));
    REQUIRE_FALSE(realtime::extract_assistant_id(json{{"name", "x"}}).has_value());

    REQUIRE(realtime::extract_assistant_list(json::array({1, 2})).size() == 2);
    REQUIRE(realtime::extract_assistant_list(json{{"items", json::array({1})}}).size() == 1);
    REQUIRE(realtime::extract_assistant_list(json{{"assistants", json::array()}}).empty());
    REQUIRE(realtime::extract_assistant_list(json{{"other", 1}}).empty());
}
