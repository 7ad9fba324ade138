#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "call_bridge/call/active_call.hpp"
#include "call_bridge/registry/session_store.hpp"

namespace call_bridge {
namespace registry {

struct RegistryOptions {
    std::string worker_id;
    std::optional<std::string> worker_address;
    std::chrono::seconds ttl{300};
};

enum class Resolution {
    Found,
    NotFound,
    Ambiguous,
};

struct ResolveResult {
    Resolution status = Resolution::NotFound;
    std::shared_ptr<call::ActiveCall> session;
    std::string call_id;
};

// Live calls of this worker keyed by call id and AI session id. Every read
// drops entries whose TTL has passed.
class SessionRegistry {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    SessionRegistry(RegistryOptions options,
                    std::shared_ptr<SessionStore> store,
                    Clock clock = Clock());

    void register_session(const std::string& call_id,
                          std::shared_ptr<call::ActiveCall> session,
                          std::optional<std::string> call_sid = std::nullopt);
    bool bind_ai_session(const std::string& call_id, const std::string& ai_session_id);
    bool refresh(const std::string& call_id);

    // With expected set, only removes the entry when it still points at that
    // session, so a finished call cannot evict its replacement.
    bool unregister(const std::string& call_id, const call::ActiveCall* expected = nullptr);

    std::shared_ptr<call::ActiveCall> find_by_call_id(const std::string& call_id);
    std::shared_ptr<call::ActiveCall> find_by_ai_session_id(const std::string& ai_session_id);

    // Explicit id: call id first, then AI session id. No id: the only live
    // session, if there is exactly one.
    ResolveResult resolve_active_session(const std::optional<std::string>& id);

    // Persisted record owned by another worker.
    std::optional<SessionRecord> find_remote(const std::string& id);

    size_t clear_worker(const std::string& worker_id);
    std::vector<std::string> active_call_ids();
    size_t active_count();

    const RegistryOptions& options() const { return options_; }

private:
    struct Entry {
        std::shared_ptr<call::ActiveCall> session;
        std::optional<std::string> call_sid;
        std::optional<std::string> ai_session_id;
        std::chrono::system_clock::time_point expires_at;
    };

    std::chrono::system_clock::time_point now() const;
    void purge_expired_locked(std::chrono::system_clock::time_point now);
    void erase_locked(std::map<std::string, Entry>::iterator it);
    void persist_locked(const std::string& call_id, const Entry& entry);
    void forget_persisted(const std::string& call_id);

    RegistryOptions options_;
    std::shared_ptr<SessionStore> store_;
    Clock clock_;
    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::string> ai_to_call_;
};

}
}
