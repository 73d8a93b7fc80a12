#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;

namespace sdc {

struct SessionRecord {
    std::string session_id;
    std::string stream_key;
    int64_t started_at_ms = 0;
    int64_t ended_at_ms = 0;  // 0 while the session is live
    std::string end_reason;
};

struct VariantRecord {
    std::string session_id;
    std::string variant;
    std::string status;
    std::string detail;
    int64_t updated_at_ms = 0;
};

// Durable ABR session history for post-hoc reporting
class SessionRecordStore {
public:
    virtual ~SessionRecordStore() = default;

    virtual void session_started(const std::string& session_id, const std::string& stream_key,
                                 int64_t started_at_ms) = 0;
    virtual void session_ended(const std::string& session_id, const std::string& reason,
                               int64_t ended_at_ms) = 0;
    virtual void variant_status(const std::string& session_id, const std::string& variant,
                                const std::string& status, const std::string& detail) = 0;

    virtual std::vector<SessionRecord> recent_sessions(int limit) = 0;
    virtual std::vector<VariantRecord> variants_for(const std::string& session_id) = 0;
};

class SqliteSessionStore : public SessionRecordStore {
public:
    // Throws std::runtime_error when the database cannot be opened or migrated
    explicit SqliteSessionStore(const std::string& path);
    ~SqliteSessionStore() override;

    SqliteSessionStore(const SqliteSessionStore&) = delete;
    SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    void session_started(const std::string& session_id, const std::string& stream_key,
                         int64_t started_at_ms) override;
    void session_ended(const std::string& session_id, const std::string& reason,
                       int64_t ended_at_ms) override;
    void variant_status(const std::string& session_id, const std::string& variant,
                        const std::string& status, const std::string& detail) override;

    std::vector<SessionRecord> recent_sessions(int limit) override;
    std::vector<VariantRecord> variants_for(const std::string& session_id) override;

private:
    void migrate();
    void exec(const char* sql);

    std::mutex db_mutex_;
    sqlite3* db_ = nullptr;
};

int64_t now_epoch_ms();

} // namespace sdc
