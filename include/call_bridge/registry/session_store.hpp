#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace call_bridge {
namespace registry {

struct SessionRecord {
    std::string call_id;
    std::optional<std::string> call_sid;
    std::optional<std::string> ai_session_id;
    std::string worker_id;
    std::optional<std::string> worker_address;
    std::chrono::system_clock::time_point expires_at;
};

nlohmann::json record_to_json(const SessionRecord& record);
SessionRecord record_from_json(const nlohmann::json& payload);

// Session records shared between workers. Implementations throw on storage
// failures.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual void upsert(const SessionRecord& record) = 0;
    virtual void remove(const std::string& call_id) = 0;
    // Matches either the call id or the AI session id.
    virtual std::optional<SessionRecord> find(const std::string& id) = 0;
    virtual size_t delete_expired(std::chrono::system_clock::time_point now) = 0;
    virtual size_t clear_worker(const std::string& worker_id) = 0;
};

class MemorySessionStore : public SessionStore {
public:
    void upsert(const SessionRecord& record) override;
    void remove(const std::string& call_id) override;
    std::optional<SessionRecord> find(const std::string& id) override;
    size_t delete_expired(std::chrono::system_clock::time_point now) override;
    size_t clear_worker(const std::string& worker_id) override;

private:
    std::mutex mutex_;
    std::map<std::string, SessionRecord> records_;
};

// One JSON document rewritten on every change. Several workers may share the
// file; the last writer wins.
class JsonFileSessionStore : public SessionStore {
public:
    explicit JsonFileSessionStore(std::filesystem::path path);

    void upsert(const SessionRecord& record) override;
    void remove(const std::string& call_id) override;
    std::optional<SessionRecord> find(const std::string& id) override;
    size_t delete_expired(std::chrono::system_clock::time_point now) override;
    size_t clear_worker(const std::string& worker_id) override;

    const std::filesystem::path& path() const { return path_; }

private:
    std::map<std::string, SessionRecord> load() const;
    void save(const std::map<std::string, SessionRecord>& records) const;

    std::filesystem::path path_;
    std::mutex mutex_;
};

}
}
