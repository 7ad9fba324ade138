#include "call_bridge/utils/scheduler.hpp"

#include <atomic>
#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace utils {

namespace {

class RepeatingTimerTask : public ScheduledTask,
                           public std::enable_shared_from_this<RepeatingTimerTask> {
public:
    RepeatingTimerTask(boost::asio::io_service& io,
                       std::chrono::milliseconds interval,
                       std::string name,
                       std::function<void()> fn)
        : io_(io),
          timer_(io),
          interval_(interval),
          name_(std::move(name)),
          fn_(std::move(fn)) {}

    void start() {
        auto self = shared_from_this();
        boost::asio::post(io_, [self]() { self->arm(); });
    }

    void cancel() override {
        if (cancelled_.exchange(true)) {
            return;
        }
        auto self = shared_from_this();
        boost::asio::post(io_, [self]() {
            boost::system::error_code ec;
            self->timer_.cancel(ec);
            self->fn_ = nullptr;
        });
    }

    bool cancelled() const override {
        return cancelled_.load();
    }

private:
    void arm() {
        if (cancelled_) {
            return;
        }
        timer_.expires_after(interval_);
        auto self = shared_from_this();
        timer_.async_wait([self](const boost::system::error_code& ec) { self->on_tick(ec); });
    }

    void on_tick(const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || cancelled_) {
            return;
        }
        if (ec) {
            logging::warn("Timer failed",
                          {kv("task", name_), kv("error", ec.message())});
            return;
        }
        if (fn_) {
            try {
                fn_();
            } catch (const std::exception& ex) {
                logging::error("Scheduled task failed",
                               {kv("task", name_), kv("error", ex.what())});
            }
        }
        arm();
    }

    boost::asio::io_service& io_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    std::string name_;
    std::function<void()> fn_;
    std::atomic<bool> cancelled_{false};
};

}

AsioScheduler::AsioScheduler(boost::asio::io_service& io)
    : io_(io) {}

std::shared_ptr<ScheduledTask> AsioScheduler::every(std::chrono::milliseconds interval,
                                                    std::string name,
                                                    std::function<void()> fn) {
    auto task = std::make_shared<RepeatingTimerTask>(io_, interval, std::move(name),
                                                     std::move(fn));
    task->start();
    return task;
}

TaskGroup::~TaskGroup() {
    cancel_all();
}

void TaskGroup::add(std::shared_ptr<ScheduledTask> task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            tasks_.push_back(std::move(task));
            return;
        }
    }
    task->cancel();
}

void TaskGroup::cancel_all() {
    std::vector<std::shared_ptr<ScheduledTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        tasks.swap(tasks_);
    }
    for (auto& task : tasks) {
        task->cancel();
    }
}

size_t TaskGroup::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

}
}
