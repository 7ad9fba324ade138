#include <catch2/catch_test_macros.hpp>

#include "call_bridge/registry/session_registry.hpp"
#include "call_bridge/registry/session_store.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <memory>
#include <string>

using namespace call_bridge;

namespace {

class StubCall : public call::ActiveCall {
public:
    explicit StubCall(std::string id) : id_(std::move(id)) {}

    std::string call_id() const override { return id_; }

    std::future<realtime::ToolResult> submit_tool_call(realtime::ToolCall) override {
        std::promise<realtime::ToolResult> promise;
        promise.set_value(realtime::ToolResult::success({}));
        return promise.get_future();
    }

private:
    std::string id_;
};

struct ManualClock {
    std::chrono::system_clock::time_point now =
        std::chrono::system_clock::time_point(std::chrono::hours(1000));

    registry::SessionRegistry::Clock fn() {
        return [this]() { return now; };
    }
};

registry::RegistryOptions options(const std::string& worker = "worker-a") {
    registry::RegistryOptions result;
    result.worker_id = worker;
    result.worker_address = "http://10.0.0.1:8000";
    result.ttl = std::chrono::seconds(300);
    return result;
}

}

TEST_CASE("registered sessions are found by call id and AI session id") {
    ManualClock clock;
    auto store = std::make_shared<registry::MemorySessionStore>();
    registry::SessionRegistry registry(options(), store, clock.fn());
    auto call = std::make_shared<StubCall>("CA1");

    registry.register_session("CA1", call, std::string("SID1"));
    REQUIRE(registry.bind_ai_session("CA1", "ai-1"));

    REQUIRE(registry.find_by_call_id("CA1") == call);
    REQUIRE(registry.find_by_ai_session_id("ai-1") == call);
    REQUIRE(registry.find_by_ai_session_id("ai-2") == nullptr);

    auto record = store->find("ai-1");
    REQUIRE(record.has_value());
    REQUIRE(record->call_id == "CA1");
    REQUIRE(record->worker_id == "worker-a");
    REQUIRE(record->call_sid == std::optional<std::string>("SID1"));
}

TEST_CASE("binding an unknown call fails") {
    registry::SessionRegistry registry(options(), nullptr);
    REQUIRE_FALSE(registry.bind_ai_session("missing", "ai"));
}

TEST_CASE("entries past their TTL disappear from every lookup") {
    ManualClock clock;
    auto store = std::make_shared<registry::MemorySessionStore>();
    registry::SessionRegistry registry(options(), store, clock.fn());
    registry.register_session("CA1", std::make_shared<StubCall>("CA1"));
    registry.bind_ai_session("CA1", "ai-1");

    clock.now += std::chrono::seconds(299);
    REQUIRE(registry.find_by_call_id("CA1") != nullptr);

    clock.now += std::chrono::seconds(1);
    REQUIRE(registry.find_by_call_id("CA1") == nullptr);
    REQUIRE(registry.find_by_ai_session_id("ai-1") == nullptr);
    REQUIRE(registry.resolve_active_session(std::nullopt).status == registry::Resolution::NotFound);
    REQUIRE(registry.active_call_ids().empty());
    REQUIRE_FALSE(store->find("CA1").has_value());
}

TEST_CASE("refresh extends the TTL") {
    ManualClock clock;
    registry::SessionRegistry registry(options(), nullptr, clock.fn());
    registry.register_session("CA1", std::make_shared<StubCall>("CA1"));

    clock.now += std::chrono::seconds(200);
    REQUIRE(registry.refresh("CA1"));
    clock.now += std::chrono::seconds(200);
    REQUIRE(registry.find_by_call_id("CA1") != nullptr);
    REQUIRE_FALSE(registry.refresh("other"));
}

TEST_CASE("re-registering a call id replaces the mapping and its alias") {
    registry::SessionRegistry registry(options(), nullptr);
    auto first = std::make_shared<StubCall>("CA1");
    auto second = std::make_shared<StubCall>("CA1");

    registry.register_session("CA1", first);
    registry.bind_ai_session("CA1", "ai-old");
    registry.register_session("CA1", second);

    REQUIRE(registry.find_by_call_id("CA1") == second);
    REQUIRE(registry.find_by_ai_session_id("ai-old") == nullptr);
    REQUIRE(registry.active_count() == 1);
}

TEST_CASE("unregister removes both keys and honours the expected session") {
    auto store = std::make_shared<registry::MemorySessionStore>();
    registry::SessionRegistry registry(options(), store);
    auto stale = std::make_shared<StubCall>("CA1");
    auto live = std::make_shared<StubCall>("CA1");
    registry.register_session("CA1", live);
    registry.bind_ai_session("CA1", "ai-1");

    REQUIRE_FALSE(registry.unregister("CA1", stale.get()));
    REQUIRE(registry.find_by_call_id("CA1") == live);

    REQUIRE(registry.unregister("CA1", live.get()));
    REQUIRE(registry.find_by_call_id("CA1") == nullptr);
    REQUIRE(registry.find_by_ai_session_id("ai-1") == nullptr);
    REQUIRE_FALSE(store->find("CA1").has_value());
    REQUIRE_FALSE(registry.unregister("CA1"));
}

TEST_CASE("resolve_active_session distinguishes explicit, single and ambiguous lookups") {
    registry::SessionRegistry registry(options(), nullptr);
    REQUIRE(registry.resolve_active_session(std::nullopt).status == registry::Resolution::NotFound);

    auto first = std::make_shared<StubCall>("CA1");
    registry.register_session("CA1", first);
    registry.bind_ai_session("CA1", "ai-1");

    auto single = registry.resolve_active_session(std::nullopt);
    REQUIRE(single.status == registry::Resolution::Found);
    REQUIRE(single.session == first);
    REQUIRE(single.call_id == "CA1");

    registry.register_session("CA2", std::make_shared<StubCall>("CA2"));
    REQUIRE(registry.resolve_active_session(std::nullopt).status == registry::Resolution::Ambiguous);
    REQUIRE(registry.resolve_active_session(std::string()).status == registry::Resolution::Ambiguous);

    auto by_alias = registry.resolve_active_session(std::string("ai-1"));
    REQUIRE(by_alias.status == registry::Resolution::Found);
    REQUIRE(by_alias.call_id == "CA1");

    REQUIRE(registry.resolve_active_session(std::string("nope")).status ==
            registry::Resolution::NotFound);
}

TEST_CASE("find_remote only returns records of other workers") {
    auto store = std::make_shared<registry::MemorySessionStore>();
    registry::SessionRegistry local(options("worker-a"), store);
    registry::SessionRegistry remote(options("worker-b"), store);

    remote.register_session("CB1", std::make_shared<StubCall>("CB1"));
    remote.bind_ai_session("CB1", "ai-b");
    local.register_session("CA1", std::make_shared<StubCall>("CA1"));

    auto record = local.find_remote("ai-b");
    REQUIRE(record.has_value());
    REQUIRE(record->worker_id == "worker-b");
    REQUIRE_FALSE(local.find_remote("CA1").has_value());
}

TEST_CASE("clear_worker removes local entries and persisted records") {
    auto store = std::make_shared<registry::MemorySessionStore>();
    registry::SessionRegistry registry(options("worker-a"), store);
    registry.register_session("CA1", std::make_shared<StubCall>("CA1"));

    registry::SessionRecord orphan;
    orphan.call_id = "CA0";
    orphan.worker_id = "worker-a";
    orphan.expires_at = std::chrono::system_clock::now() + std::chrono::hours(1);
    store->upsert(orphan);

    REQUIRE(registry.clear_worker("worker-a") == 3);
    REQUIRE(registry.active_count() == 0);
    REQUIRE_FALSE(store->find("CA0").has_value());
}

TEST_CASE("json file store persists records across instances") {
    const auto path = std::filesystem::temp_directory_path() /
                      ("call_bridge_store_" + std::to_string(std::chrono::steady_clock::now()
                                                                 .time_since_epoch()
                                                                 .count()) +
                       ".json");
    const auto expires = std::chrono::system_clock::now() + std::chrono::minutes(5);
    {
        registry::JsonFileSessionStore store(path);
        registry::SessionRecord record;
        record.call_id = "CA1";
        record.ai_session_id = "ai-1";
        record.worker_id = "worker-b";
        record.worker_address = "http://10.0.0.2:8000";
        record.expires_at = expires;
        store.upsert(record);
    }
    {
        registry::JsonFileSessionStore store(path);
        auto record = store.find("ai-1");
        REQUIRE(record.has_value());
        REQUIRE(record->worker_address == std::optional<std::string>("http://10.0.0.2:8000"));
        REQUIRE(std::chrono::duration_cast<std::chrono::milliseconds>(
                    record->expires_at - expires).count() == 0);

        REQUIRE(store.delete_expired(expires + std::chrono::seconds(1)) == 1);
        REQUIRE_FALSE(store.find("CA1").has_value());
    }
    std::filesystem::remove(path);
}
