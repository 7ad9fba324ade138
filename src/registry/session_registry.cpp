#include "call_bridge/registry/session_registry.hpp"

#include <exception>
#include <iterator>
#include <utility>

#include "call_bridge/logging.hpp"

namespace call_bridge {
namespace registry {

SessionRegistry::SessionRegistry(RegistryOptions options,
                                 std::shared_ptr<SessionStore> store,
                                 Clock clock)
    : options_(std::move(options)),
      store_(store ? std::move(store) : std::make_shared<MemorySessionStore>()),
      clock_(std::move(clock)) {}

void SessionRegistry::register_session(const std::string& call_id,
                                       std::shared_ptr<call::ActiveCall> session,
                                       std::optional<std::string> call_sid) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    purge_expired_locked(current);

    auto existing = entries_.find(call_id);
    if (existing != entries_.end()) {
        if (existing->second.session != session) {
            logging::warn("Replacing registered session", {kv("call_id", call_id)});
        }
        if (existing->second.ai_session_id) {
            ai_to_call_.erase(*existing->second.ai_session_id);
        }
    }

    Entry entry;
    entry.session = std::move(session);
    entry.call_sid = std::move(call_sid);
    entry.expires_at = current + options_.ttl;
    entries_[call_id] = entry;
    persist_locked(call_id, entry);
    logging::debug("Session registered", {kv("call_id", call_id)});
}

bool SessionRegistry::bind_ai_session(const std::string& call_id,
                                      const std::string& ai_session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    purge_expired_locked(current);
    auto it = entries_.find(call_id);
    if (it == entries_.end()) {
        logging::warn("Cannot bind AI session to unknown call",
                      {kv("call_id", call_id), kv("ai_session_id", ai_session_id)});
        return false;
    }
    if (it->second.ai_session_id) {
        ai_to_call_.erase(*it->second.ai_session_id);
    }
    it->second.ai_session_id = ai_session_id;
    it->second.expires_at = current + options_.ttl;
    ai_to_call_[ai_session_id] = call_id;
    persist_locked(call_id, it->second);
    return true;
}

bool SessionRegistry::refresh(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();
    purge_expired_locked(current);
    auto it = entries_.find(call_id);
    if (it == entries_.end()) {
        return false;
    }
    it->second.expires_at = current + options_.ttl;
    persist_locked(call_id, it->second);
    return true;
}

bool SessionRegistry::unregister(const std::string& call_id, const call::ActiveCall* expected) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(call_id);
        if (it != entries_.end()) {
            if (expected && it->second.session.get() != expected) {
                logging::debug("Skipping unregister of replaced session", {kv("call_id", call_id)});
                return false;
            }
            erase_locked(it);
            removed = true;
        }
    }
    forget_persisted(call_id);
    return removed;
}

std::shared_ptr<call::ActiveCall> SessionRegistry::find_by_call_id(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now());
    auto it = entries_.find(call_id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.session;
}

std::shared_ptr<call::ActiveCall> SessionRegistry::find_by_ai_session_id(
    const std::string& ai_session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now());
    auto alias = ai_to_call_.find(ai_session_id);
    if (alias == ai_to_call_.end()) {
        return nullptr;
    }
    auto it = entries_.find(alias->second);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second.session;
}

ResolveResult SessionRegistry::resolve_active_session(const std::optional<std::string>& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now());
    ResolveResult result;

    if (id && !id->empty()) {
        auto it = entries_.find(*id);
        if (it == entries_.end()) {
            auto alias = ai_to_call_.find(*id);
            if (alias != ai_to_call_.end()) {
                it = entries_.find(alias->second);
            }
        }
        if (it != entries_.end()) {
            result.status = Resolution::Found;
            result.session = it->second.session;
            result.call_id = it->first;
        }
        return result;
    }

    if (entries_.size() == 1) {
        result.status = Resolution::Found;
        result.session = entries_.begin()->second.session;
        result.call_id = entries_.begin()->first;
    } else if (entries_.size() > 1) {
        result.status = Resolution::Ambiguous;
    }
    return result;
}

std::optional<SessionRecord> SessionRegistry::find_remote(const std::string& id) {
    try {
        store_->delete_expired(now());
        auto record = store_->find(id);
        if (record && record->worker_id != options_.worker_id) {
            return record;
        }
    } catch (const std::exception& ex) {
        logging::error("Session store lookup failed", {kv("id", id), kv("error", ex.what())});
    }
    return std::nullopt;
}

size_t SessionRegistry::clear_worker(const std::string& worker_id) {
    size_t removed = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (worker_id == options_.worker_id) {
            removed = entries_.size();
            entries_.clear();
            ai_to_call_.clear();
        }
    }
    try {
        removed += store_->clear_worker(worker_id);
    } catch (const std::exception& ex) {
        logging::error("Failed to clear worker sessions",
                       {kv("worker_id", worker_id), kv("error", ex.what())});
    }
    logging::info("Cleared worker sessions", {kv("worker_id", worker_id), kv("removed", removed)});
    return removed;
}

std::vector<std::string> SessionRegistry::active_call_ids() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now());
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& item : entries_) {
        ids.push_back(item.first);
    }
    return ids;
}

size_t SessionRegistry::active_count() {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_expired_locked(now());
    return entries_.size();
}

std::chrono::system_clock::time_point SessionRegistry::now() const {
    return clock_ ? clock_() : std::chrono::system_clock::now();
}

void SessionRegistry::purge_expired_locked(std::chrono::system_clock::time_point current) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at <= current) {
            logging::info("Session registry entry expired", {kv("call_id", it->first)});
            auto next = std::next(it);
            erase_locked(it);
            it = next;
        } else {
            ++it;
        }
    }
    try {
        store_->delete_expired(current);
    } catch (const std::exception& ex) {
        logging::error("Failed to purge expired session records", {kv("error", ex.what())});
    }
}

void SessionRegistry::erase_locked(std::map<std::string, Entry>::iterator it) {
    if (it->second.ai_session_id) {
        auto alias = ai_to_call_.find(*it->second.ai_session_id);
        if (alias != ai_to_call_.end() && alias->second == it->first) {
            ai_to_call_.erase(alias);
        }
    }
    entries_.erase(it);
}

void SessionRegistry::persist_locked(const std::string& call_id, const Entry& entry) {
    SessionRecord record;
    record.call_id = call_id;
    record.call_sid = entry.call_sid;
    record.ai_session_id = entry.ai_session_id;
    record.worker_id = options_.worker_id;
    record.worker_address = options_.worker_address;
    record.expires_at = entry.expires_at;
    try {
        store_->upsert(record);
    } catch (const std::exception& ex) {
        logging::error("Failed to persist session record",
                       {kv("call_id", call_id), kv("error", ex.what())});
    }
}

void SessionRegistry::forget_persisted(const std::string& call_id) {
    try {
        store_->remove(call_id);
    } catch (const std::exception& ex) {
        logging::error("Failed to remove session record",
                       {kv("call_id", call_id), kv("error", ex.what())});
    }
}

}
}
