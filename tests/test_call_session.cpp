#include <catch2/catch_test_macros.hpp>

#include "call_bridge/audio/g711.hpp"
#include "call_bridge/call/call_session.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <websocketpp/base64/base64.hpp>

#include "fakes.hpp"

using namespace call_bridge;
using nlohmann::json;

namespace {

class FakeCompanyLookup : public business::CompanyLookup {
public:
    std::optional<business::AssistantConfig> config;
    std::vector<std::string> numbers;
    std::function<void()> on_lookup;

    std::optional<business::AssistantConfig> find_by_number(const std::string& number) override {
        numbers.push_back(number);
        if (on_lookup) {
            on_lookup();
        }
        return config;
    }
};

class FakeGateway : public realtime::RealtimeGateway {
public:
    std::shared_ptr<testing::FakeRealtimeSession> session =
        std::make_shared<testing::FakeRealtimeSession>("ai-77");
    realtime::RealtimeCallbacks callbacks;
    bool fail = false;
    int opened = 0;

    std::unique_ptr<realtime::RealtimeSession> open_session(
        const std::string& call_id,
        std::shared_ptr<const business::AssistantConfig> config,
        realtime::RealtimeCallbacks cbs) override {
        ++opened;
        if (fail) {
            throw std::runtime_error("provider unavailable");
        }
        remember_config(call_id, std::move(config));
        callbacks = std::move(cbs);
        return std::make_unique<testing::SharedSessionProxy>(session);
    }
};

class FakeTransfer : public business::CallTransfer {
public:
    std::vector<std::string> numbers;

    json transfer(const std::string&, const std::string& phone_number,
                  const business::TransferOptions&) override {
        numbers.push_back(phone_number);
        return json::object();
    }
};

struct Harness {
    std::shared_ptr<FakeCompanyLookup> lookup = std::make_shared<FakeCompanyLookup>();
    std::shared_ptr<FakeGateway> gateway = std::make_shared<FakeGateway>();
    std::shared_ptr<registry::SessionRegistry> registry = std::make_shared<registry::SessionRegistry>(
        registry::RegistryOptions{"worker-1", std::nullopt, std::chrono::seconds(300)}, nullptr);
    std::shared_ptr<FakeTransfer> transfer = std::make_shared<FakeTransfer>();
    std::shared_ptr<testing::ManualScheduler> scheduler = std::make_shared<testing::ManualScheduler>();
    std::shared_ptr<testing::FakeCarrierChannel> carrier = std::make_shared<testing::FakeCarrierChannel>();
    std::shared_ptr<testing::InlineExecutor> executor = std::make_shared<testing::InlineExecutor>();
    std::vector<std::string> finished;

    Harness() {
        business::AssistantConfig config;
        config.company_id = "42";
        config.company_name = "Dental Care";
        lookup->config = config;
    }

    std::shared_ptr<call::CallSession> make(bool interruptions_allowed = true) {
        realtime::ToolCollaborators collaborators;
        collaborators.transfer = transfer;

        call::CallDependencies deps;
        deps.company_lookup = lookup;
        deps.gateway = gateway;
        deps.registry = registry;
        deps.dispatcher = std::make_shared<realtime::ToolDispatcher>(collaborators, "Europe/Amsterdam");
        deps.scheduler = scheduler;

        call::CallOptions options;
        options.interruptions_allowed = interruptions_allowed;
        options.keepalive_interval = std::chrono::milliseconds(15000);

        auto session = std::make_shared<call::CallSession>("+31201234567", carrier, executor,
                                                           deps, options);
        session->set_on_finished([this](const std::string& call_id) { finished.push_back(call_id); });
        return session;
    }
};

std::string loud_frame() {
    return websocketpp::base64_encode(audio::encode_ulaw_frame(std::vector<int16_t>(160, 8000)));
}

std::string silent_frame() {
    return websocketpp::base64_encode(std::string(160, '\xFF'));
}

void feed(call::CallSession& session, const std::string& frame, int count) {
    for (int i = 0; i < count; ++i) {
        session.on_carrier_media(frame);
    }
}

}

TEST_CASE("start resolves the company, opens the AI session and registers both keys") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    REQUIRE(session->state() == call::CallState::Streaming);
    REQUIRE(h.lookup->numbers == std::vector<std::string>{"+31201234567"});
    REQUIRE(session->ai_session_id() == std::string("ai-77"));
    REQUIRE(h.registry->find_by_call_id("CA1") == session);
    REQUIRE(h.registry->find_by_ai_session_id("ai-77") == session);
    REQUIRE(h.gateway->config_for(std::string("CA1"))->company_id == "42");
    REQUIRE(h.scheduler->live() == 1);
    REQUIRE(h.scheduler->intervals[0] == std::chrono::milliseconds(15000));
}

TEST_CASE("a second start is ignored") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");
    session->start("CA2", "MZ2");

    REQUIRE(h.gateway->opened == 1);
    REQUIRE(session->call_id() == "CA1");
}

TEST_CASE("unknown destination tears the call down without opening a session") {
    Harness h;
    h.lookup->config.reset();
    auto session = h.make();
    session->start("CA1", "MZ1");

    REQUIRE(session->state() == call::CallState::Closed);
    REQUIRE(h.gateway->opened == 0);
    REQUIRE(h.carrier->closed());
    REQUIRE(h.carrier->frames.empty());
    REQUIRE(h.registry->active_count() == 0);
    REQUIRE(h.finished == std::vector<std::string>{"CA1"});
}

TEST_CASE("provider failure during startup closes the carrier leg") {
    Harness h;
    h.gateway->fail = true;
    auto session = h.make();
    session->start("CA1", "MZ1");

    REQUIRE(session->state() == call::CallState::Closed);
    REQUIRE(h.carrier->closed());
    REQUIRE(h.registry->find_by_call_id("CA1") == nullptr);
    REQUIRE(h.scheduler->live() == 0);
}

TEST_CASE("caller audio is forwarded unchanged and commits end the user turn") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    feed(*session, loud_frame(), 10);
    REQUIRE(h.gateway->session->binaries().size() == 10);
    REQUIRE(h.gateway->session->binaries()[0] ==
            audio::encode_ulaw_frame(std::vector<int16_t>(160, 8000)));

    feed(*session, silent_frame(), 25);
    REQUIRE(h.gateway->session->types() ==
            std::vector<std::string>{"input_audio_buffer.commit", "response.create"});
}

TEST_CASE("media before streaming is dropped") {
    Harness h;
    auto session = h.make();
    session->on_carrier_media(loud_frame());
    REQUIRE(h.gateway->session->binaries().empty());
}

TEST_CASE("assistant audio is marked once per turn") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    h.gateway->callbacks.on_audio("abc");
    h.gateway->callbacks.on_audio("def");
    REQUIRE(h.carrier->events() == std::vector<std::string>{"mark", "media", "media"});
    REQUIRE(h.carrier->frames[0].at("mark").at("name") == "response-1");
    REQUIRE(h.carrier->frames[1].at("streamSid") == "MZ1");
    REQUIRE(h.carrier->frames[1].at("media").at("payload") == websocketpp::base64_encode("abc"));
    REQUIRE(session->assistant_speaking());

    session->on_carrier_mark("response-1");
    REQUIRE_FALSE(session->pending_mark().has_value());

    h.gateway->callbacks.on_turn_completed();
    REQUIRE_FALSE(session->assistant_speaking());
    h.gateway->callbacks.on_audio("ghi");
    REQUIRE(h.carrier->frames[3].at("mark").at("name") == "response-2");
}

TEST_CASE("speech onset while the assistant talks interrupts it") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");
    h.gateway->callbacks.on_audio("abc");

    session->on_carrier_media(loud_frame());

    REQUIRE(h.carrier->events().back() == "clear");
    REQUIRE(h.gateway->session->types() == std::vector<std::string>{"response.cancel"});
    REQUIRE_FALSE(session->assistant_speaking());
}

TEST_CASE("interruptions can be disabled") {
    Harness h;
    auto session = h.make(false);
    session->start("CA1", "MZ1");
    h.gateway->callbacks.on_audio("abc");

    session->on_carrier_media(loud_frame());

    REQUIRE(h.carrier->events().back() == "media");
    REQUIRE(h.gateway->session->types().empty());
    REQUIRE(session->assistant_speaking());
}

TEST_CASE("tool calls from the AI are answered on the same session") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    h.gateway->callbacks.on_tool_call({"tc-1", "transfer", {{"phoneNumber", "+31 20 765 4321"}}});
    h.gateway->callbacks.on_tool_call({"tc-2", "launch_rocket", json::object()});

    const auto frames = h.gateway->session->json_frames();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0].at("type") == "tool.response.create");
    REQUIRE(frames[0].at("tool_response").at("tool_call_id") == "tc-1");
    const auto first = json::parse(frames[0].at("tool_response").at("output").get<std::string>());
    REQUIRE(first.at("success") == true);
    REQUIRE(first.at("data").at("transferredTo") == "+31207654321");
    REQUIRE(h.transfer->numbers == std::vector<std::string>{"+31207654321"});

    const auto second = json::parse(frames[1].at("tool_response").at("output").get<std::string>());
    REQUIRE(second == json{{"success", false}, {"error", "Unknown tool: launch_rocket"}});
}

TEST_CASE("webhook tool calls share the session queue") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    auto result = session->submit_tool_call({"tc-9", "check_calendar_availability",
                                             {{"date", "2024-01-08"}}});
    REQUIRE(result.get().error == "Calendar integration not available");
}

TEST_CASE("keepalive pings the AI session and refreshes the registry") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    h.scheduler->tick();
    h.scheduler->tick();
    REQUIRE(h.gateway->session->pings() == 2);
}

TEST_CASE("teardown releases everything exactly once") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    session->on_carrier_stop();
    session->teardown("again");
    session->on_carrier_closed("socket closed");

    REQUIRE(session->state() == call::CallState::Closed);
    REQUIRE(h.finished == std::vector<std::string>{"CA1"});
    REQUIRE(h.gateway->session->closed());
    REQUIRE(h.gateway->session->close_reason() == "carrier stop");
    REQUIRE(h.carrier->closed());
    REQUIRE(h.scheduler->live() == 0);
    REQUIRE(h.registry->find_by_call_id("CA1") == nullptr);
    REQUIRE(h.registry->find_by_ai_session_id("ai-77") == nullptr);
    REQUIRE(h.gateway->config_count() == 0);
    REQUIRE(h.executor->stopped());

    auto late = session->submit_tool_call({"tc-late", "transfer", {{"phoneNumber", "+3120"}}});
    REQUIRE(late.get().error == "Call has ended");

    session->on_carrier_media(loud_frame());
    REQUIRE(h.gateway->session->binaries().empty());
}

TEST_CASE("hang-up during startup leaves no snapshot behind") {
    Harness h;
    auto session = h.make();
    std::weak_ptr<call::CallSession> weak = session;
    h.lookup->on_lookup = [weak]() {
        if (auto self = weak.lock()) {
            self->teardown("carrier stop");
        }
    };
    session->start("CA1", "MZ1");

    REQUIRE(session->state() == call::CallState::Closed);
    REQUIRE(h.gateway->opened == 1);
    REQUIRE(h.gateway->session->closed());
    REQUIRE(h.gateway->config_count() == 0);
    REQUIRE(h.gateway->config_for(std::nullopt) == nullptr);
    REQUIRE(h.registry->find_by_call_id("CA1") == nullptr);
}

TEST_CASE("tool calls use the snapshot kept by the gateway") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    REQUIRE(h.gateway->config_for(std::string("CA1"))->company_id == "42");
    h.gateway->forget_config("CA1");
    auto result = session->submit_tool_call({"tc-1", "transfer", {{"phoneNumber", "+31207654321"}}});
    REQUIRE(result.get().error == "Call is not configured");
    REQUIRE(h.transfer->numbers.empty());
}

TEST_CASE("AI session close ends the call") {
    Harness h;
    auto session = h.make();
    session->start("CA1", "MZ1");

    h.gateway->callbacks.on_closed("code 1000");

    REQUIRE(session->state() == call::CallState::Closed);
    REQUIRE(h.carrier->closed());
}
