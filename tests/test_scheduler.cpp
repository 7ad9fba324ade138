#include <catch2/catch_test_macros.hpp>

#include "call_bridge/utils/executor.hpp"
#include "call_bridge/utils/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <boost/asio/io_service.hpp>

using namespace call_bridge;

namespace {

class FakeTask : public utils::ScheduledTask {
public:
    void cancel() override { cancelled_ = true; }
    bool cancelled() const override { return cancelled_; }

private:
    bool cancelled_ = false;
};

}

TEST_CASE("serial executor runs tasks in posting order") {
    std::vector<int> order;
    std::mutex mutex;
    std::promise<void> done;
    {
        utils::SerialExecutor executor("test");
        for (int i = 0; i < 50; ++i) {
            REQUIRE(executor.post([&, i]() {
                std::lock_guard<std::mutex> lock(mutex);
                order.push_back(i);
            }));
        }
        REQUIRE(executor.post([&]() { done.set_value(); }));
        REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    }
    REQUIRE(order.size() == 50);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(order[static_cast<size_t>(i)] == i);
    }
}

TEST_CASE("serial executor rejects work after shutdown") {
    utils::SerialExecutor executor("test");
    executor.shutdown();
    REQUIRE_FALSE(executor.post([]() {}));
}

TEST_CASE("serial executor survives a throwing task") {
    utils::SerialExecutor executor("test");
    std::promise<void> done;
    executor.post([]() { throw std::runtime_error("boom"); });
    executor.post([&]() { done.set_value(); });
    REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
}

TEST_CASE("serial executor may be released from its own task") {
    auto executor = std::make_shared<utils::SerialExecutor>("self");
    std::promise<void> done;
    auto* raw = executor.get();
    raw->post([executor = std::move(executor), &done]() mutable {
        executor.reset();
        done.set_value();
    });
    REQUIRE(done.get_future().wait_for(std::chrono::seconds(5)) == std::future_status::ready);
}

TEST_CASE("asio scheduler repeats until cancelled") {
    boost::asio::io_service io;
    utils::AsioScheduler scheduler(io);
    std::atomic<int> ticks{0};
    std::shared_ptr<utils::ScheduledTask> task;
    task = scheduler.every(std::chrono::milliseconds(5), "tick", [&]() {
        if (++ticks == 3) {
            task->cancel();
        }
    });

    io.run_for(std::chrono::milliseconds(500));

    REQUIRE(ticks == 3);
    REQUIRE(task->cancelled());
}

TEST_CASE("task group cancels every task together") {
    utils::TaskGroup group;
    auto first = std::make_shared<FakeTask>();
    auto second = std::make_shared<FakeTask>();
    group.add(first);
    group.add(second);
    REQUIRE(group.size() == 2);

    group.cancel_all();

    REQUIRE(first->cancelled());
    REQUIRE(second->cancelled());
    REQUIRE(group.size() == 0);
}

TEST_CASE("task added after cancel_all is cancelled immediately") {
    utils::TaskGroup group;
    group.cancel_all();
    auto late = std::make_shared<FakeTask>();
    group.add(late);
    REQUIRE(late->cancelled());
    REQUIRE(group.size() == 0);
}
