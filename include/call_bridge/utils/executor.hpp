#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace call_bridge {
namespace utils {

class Executor {
public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    // Returns false once the executor has been shut down.
    virtual bool post(Task task) = 0;
    virtual void shutdown() = 0;
};

// One worker thread draining a FIFO queue. Tasks run one at a time in the
// order they were posted. Pending tasks still run after shutdown.
class SerialExecutor : public Executor {
public:
    explicit SerialExecutor(std::string name);
    ~SerialExecutor() override;

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;

    bool post(Task task) override;
    void shutdown() override;

private:
    struct Queue;

    static void worker_loop(std::shared_ptr<Queue> queue);

    std::shared_ptr<Queue> queue_;
    std::thread worker_;
};

}
}
