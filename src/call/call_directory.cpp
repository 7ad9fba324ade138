#include "call_bridge/call/call_directory.hpp"

#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace call {

void CallDirectory::add(const std::string& call_id, std::shared_ptr<CallSession> call) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it != calls_.end() && it->second != call) {
        logging::warn("Call id reused by a new carrier stream", {kv("call_id", call_id)});
    }
    calls_[call_id] = std::move(call);
}

bool CallDirectory::remove(const std::string& call_id, const CallSession* expected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    if (it == calls_.end() || it->second.get() != expected) {
        return false;
    }
    calls_.erase(it);
    return true;
}

std::shared_ptr<CallSession> CallDirectory::find(const std::string& call_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(call_id);
    return it == calls_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<CallSession>> CallDirectory::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<CallSession>> calls;
    calls.reserve(calls_.size());
    for (const auto& entry : calls_) {
        calls.push_back(entry.second);
    }
    return calls;
}

size_t CallDirectory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

}
}
