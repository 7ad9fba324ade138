#include "call_bridge/utils/executor.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace utils {

// Shared with the worker thread so it outlives an executor that is destroyed
// from one of its own tasks.
struct SerialExecutor::Queue {
    std::string name;
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> tasks;
    bool stop = false;
};

SerialExecutor::SerialExecutor(std::string name)
    : queue_(std::make_shared<Queue>()) {
    queue_->name = std::move(name);
    worker_ = std::thread(&SerialExecutor::worker_loop, queue_);
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        if (queue_->stop) {
            return false;
        }
        queue_->tasks.push_back(std::move(task));
    }
    queue_->cv.notify_one();
    return true;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_->mutex);
        queue_->stop = true;
    }
    queue_->cv.notify_one();
    if (!worker_.joinable()) {
        return;
    }
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
    } else {
        worker_.join();
    }
}

void SerialExecutor::worker_loop(std::shared_ptr<Queue> queue) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue->mutex);
            queue->cv.wait(lock, [&queue]() { return queue->stop || !queue->tasks.empty(); });
            if (queue->stop && queue->tasks.empty()) {
                break;
            }
            task = std::move(queue->tasks.front());
            queue->tasks.pop_front();
        }
        if (!task) {
            continue;
        }
        try {
            task();
        } catch (const std::exception& ex) {
            logging::error("Executor task failed",
                           {kv("executor", queue->name), kv("error", ex.what())});
        }
    }
}

}
}
