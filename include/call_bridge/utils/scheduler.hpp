#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_service.hpp>

namespace call_bridge {
namespace utils {

class ScheduledTask {
public:
    virtual ~ScheduledTask() = default;
    virtual void cancel() = 0;
    virtual bool cancelled() const = 0;
};

class Scheduler {
public:
    virtual ~Scheduler() = default;

    // Runs fn every interval until the returned task is cancelled.
    virtual std::shared_ptr<ScheduledTask> every(std::chrono::milliseconds interval,
                                                 std::string name,
                                                 std::function<void()> fn) = 0;
};

class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_service& io);

    std::shared_ptr<ScheduledTask> every(std::chrono::milliseconds interval,
                                         std::string name,
                                         std::function<void()> fn) override;

private:
    boost::asio::io_service& io_;
};

// Owns the timers of one call; cancel_all stops every one of them.
class TaskGroup {
public:
    TaskGroup() = default;
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    void add(std::shared_ptr<ScheduledTask> task);
    void cancel_all();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ScheduledTask>> tasks_;
    bool closed_ = false;
};

}
}
