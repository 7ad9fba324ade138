#include "call_bridge/registry/session_store.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace call_bridge {
namespace registry {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point value) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch())
        .count();
}

std::chrono::system_clock::time_point from_epoch_ms(int64_t value) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(value)));
}

std::optional<std::string> optional_string(const nlohmann::json& payload, const char* key) {
    auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

bool matches(const SessionRecord& record, const std::string& id) {
    return record.call_id == id || (record.ai_session_id && *record.ai_session_id == id);
}

template <typename Predicate>
size_t erase_if(std::map<std::string, SessionRecord>& records, Predicate predicate) {
    size_t removed = 0;
    for (auto it = records.begin(); it != records.end();) {
        if (predicate(it->second)) {
            it = records.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

}

nlohmann::json record_to_json(const SessionRecord& record) {
    nlohmann::json payload = {
        {"callId", record.call_id},
        {"workerId", record.worker_id},
        {"expiresAt", to_epoch_ms(record.expires_at)},
    };
    if (record.call_sid) {
        payload["callSid"] = *record.call_sid;
    }
    if (record.ai_session_id) {
        payload["aiSessionId"] = *record.ai_session_id;
    }
    if (record.worker_address) {
        payload["workerAddress"] = *record.worker_address;
    }
    return payload;
}

SessionRecord record_from_json(const nlohmann::json& payload) {
    SessionRecord record;
    record.call_id = payload.at("callId").get<std::string>();
    record.worker_id = payload.at("workerId").get<std::string>();
    record.expires_at = from_epoch_ms(payload.at("expiresAt").get<int64_t>());
    record.call_sid = optional_string(payload, "callSid");
    record.ai_session_id = optional_string(payload, "aiSessionId");
    record.worker_address = optional_string(payload, "workerAddress");
    return record;
}

void MemorySessionStore::upsert(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[record.call_id] = record;
}

void MemorySessionStore::remove(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(call_id);
}

std::optional<SessionRecord> MemorySessionStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : records_) {
        if (matches(item.second, id)) {
            return item.second;
        }
    }
    return std::nullopt;
}

size_t MemorySessionStore::delete_expired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return erase_if(records_, [now](const SessionRecord& record) {
        return record.expires_at <= now;
    });
}

size_t MemorySessionStore::clear_worker(const std::string& worker_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return erase_if(records_, [&worker_id](const SessionRecord& record) {
        return record.worker_id == worker_id;
    });
}

JsonFileSessionStore::JsonFileSessionStore(std::filesystem::path path)
    : path_(std::move(path)) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }
}

void JsonFileSessionStore::upsert(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = load();
    records[record.call_id] = record;
    save(records);
}

void JsonFileSessionStore::remove(const std::string& call_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = load();
    if (records.erase(call_id) > 0) {
        save(records);
    }
}

std::optional<SessionRecord> JsonFileSessionStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : load()) {
        if (matches(item.second, id)) {
            return item.second;
        }
    }
    return std::nullopt;
}

size_t JsonFileSessionStore::delete_expired(std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = load();
    const auto removed = erase_if(records, [now](const SessionRecord& record) {
        return record.expires_at <= now;
    });
    if (removed > 0) {
        save(records);
    }
    return removed;
}

size_t JsonFileSessionStore::clear_worker(const std::string& worker_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto records = load();
    const auto removed = erase_if(records, [&worker_id](const SessionRecord& record) {
        return record.worker_id == worker_id;
    });
    if (removed > 0) {
        save(records);
    }
    return removed;
}

std::map<std::string, SessionRecord> JsonFileSessionStore::load() const {
    std::map<std::string, SessionRecord> records;
    std::ifstream input(path_);
    if (!input) {
        return records;
    }
    const std::string content((std::istreambuf_iterator<char>(input)),
                              std::istreambuf_iterator<char>());
    if (content.empty()) {
        return records;
    }
    auto document = nlohmann::json::parse(content, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        throw std::runtime_error("Session store is not valid JSON: " + path_.string());
    }
    auto sessions = document.find("sessions");
    if (sessions == document.end() || !sessions->is_object()) {
        return records;
    }
    for (const auto& item : sessions->items()) {
        records[item.key()] = record_from_json(item.value());
    }
    return records;
}

void JsonFileSessionStore::save(const std::map<std::string, SessionRecord>& records) const {
    nlohmann::json sessions = nlohmann::json::object();
    for (const auto& item : records) {
        sessions[item.first] = record_to_json(item.second);
    }
    const nlohmann::json document = {{"sessions", sessions}};

    auto temp_path = path_;
    temp_path += ".tmp";
    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (!output) {
            throw std::runtime_error("Cannot write session store: " + temp_path.string());
        }
        output << document.dump(2);
        if (!output) {
            throw std::runtime_error("Failed writing session store: " + temp_path.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        throw std::runtime_error("Cannot replace session store " + path_.string() + ": " +
                                 ec.message());
    }
}

}
}
