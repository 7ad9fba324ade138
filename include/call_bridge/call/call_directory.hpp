#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "call_bridge/call/call_session.hpp"

namespace call_bridge {
namespace call {

// Calls owned by this process, keyed by carrier call id. Used to tear every
// call down on shutdown.
class CallDirectory {
public:
    void add(const std::string& call_id, std::shared_ptr<CallSession> call);

    // Only removes the entry while it still points at `expected`; a newer
    // session registered under the same call id is left alone.
    bool remove(const std::string& call_id, const CallSession* expected);

    std::shared_ptr<CallSession> find(const std::string& call_id) const;
    std::vector<std::shared_ptr<CallSession>> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CallSession>> calls_;
};

}
}
