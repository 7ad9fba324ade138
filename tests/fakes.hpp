#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "call_bridge/realtime/realtime_session.hpp"
#include "call_bridge/telephony/carrier_channel.hpp"
#include "call_bridge/utils/executor.hpp"
#include "call_bridge/utils/scheduler.hpp"

namespace call_bridge::testing {

class FakeRealtimeSession : public realtime::RealtimeSession {
public:
    explicit FakeRealtimeSession(std::string id = "ai-1") : id_(std::move(id)) {}

    const std::string& id() const override { return id_; }

    bool send_text(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        texts_.push_back(payload);
        return true;
    }

    bool send_binary(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        binaries_.push_back(payload);
        return true;
    }

    bool ping() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        ++pings_;
        return true;
    }

    void close(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        close_reason_ = reason;
    }

    bool closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::vector<nlohmann::json> json_frames() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<nlohmann::json> frames;
        for (const auto& text : texts_) {
            frames.push_back(nlohmann::json::parse(text));
        }
        return frames;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> result;
        for (const auto& frame : json_frames()) {
            result.push_back(frame.value("type", ""));
        }
        return result;
    }

    std::vector<std::string> binaries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return binaries_;
    }

    int pings() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return pings_;
    }

    std::string close_reason() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_reason_;
    }

private:
    std::string id_;
    mutable std::mutex mutex_;
    std::vector<std::string> texts_;
    std::vector<std::string> binaries_;
    int pings_ = 0;
    bool closed_ = false;
    std::string close_reason_;
};

// Hands out a session whose frames stay observable after the owner drops it.
class SharedSessionProxy : public realtime::RealtimeSession {
public:
    explicit SharedSessionProxy(std::shared_ptr<FakeRealtimeSession> target)
        : target_(std::move(target)) {}

    const std::string& id() const override { return target_->id(); }
    bool send_text(const std::string& payload) override { return target_->send_text(payload); }
    bool send_binary(const std::string& payload) override { return target_->send_binary(payload); }
    bool ping() override { return target_->ping(); }
    void close(const std::string& reason) override { target_->close(reason); }
    bool closed() const override { return target_->closed(); }

private:
    std::shared_ptr<FakeRealtimeSession> target_;
};

// Runs every task on the posting thread.
class InlineExecutor : public utils::Executor {
public:
    bool post(Task task) override {
        if (stopped_) {
            return false;
        }
        task();
        return true;
    }

    void shutdown() override { stopped_ = true; }

    bool stopped() const { return stopped_; }

private:
    bool stopped_ = false;
};

class ManualScheduler : public utils::Scheduler {
public:
    class Task : public utils::ScheduledTask {
    public:
        explicit Task(std::function<void()> fn) : fn(std::move(fn)) {}

        void cancel() override { cancelled_ = true; }
        bool cancelled() const override { return cancelled_; }

        std::function<void()> fn;

    private:
        bool cancelled_ = false;
    };

    std::shared_ptr<utils::ScheduledTask> every(std::chrono::milliseconds interval,
                                                std::string name,
                                                std::function<void()> fn) override {
        auto task = std::make_shared<Task>(std::move(fn));
        intervals.push_back(interval);
        names.push_back(std::move(name));
        tasks.push_back(task);
        return task;
    }

    void tick() {
        for (const auto& task : tasks) {
            if (!task->cancelled()) {
                task->fn();
            }
        }
    }

    size_t live() const {
        size_t count = 0;
        for (const auto& task : tasks) {
            if (!task->cancelled()) {
                ++count;
            }
        }
        return count;
    }

    std::vector<std::shared_ptr<Task>> tasks;
    std::vector<std::chrono::milliseconds> intervals;
    std::vector<std::string> names;
};

class FakeCarrierChannel : public telephony::CarrierChannel {
public:
    bool send_text(const std::string& payload) override {
        if (closed_) {
            return false;
        }
        frames.push_back(nlohmann::json::parse(payload));
        return true;
    }

    void close(const std::string& reason) override {
        closed_ = true;
        close_reason = reason;
    }

    bool closed() const override { return closed_; }

    std::vector<std::string> events() const {
        std::vector<std::string> result;
        for (const auto& frame : frames) {
            result.push_back(frame.value("event", ""));
        }
        return result;
    }

    std::vector<nlohmann::json> frames;
    std::string close_reason;

private:
    bool closed_ = false;
};

}
