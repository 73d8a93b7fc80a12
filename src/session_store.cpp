#include "session_store.hpp"
#include <spdlog/spdlog.h>
#include <sqlite3.h>
#include <stdexcept>

namespace sdc {

int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

namespace {

// Finalizes the statement on scope exit
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string err = sqlite3_errmsg(db);
            stmt_ = nullptr;
            throw std::runtime_error("sqlite prepare failed: " + err);
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int idx, const std::string& value) {
        sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int idx, int64_t value) { sqlite3_bind_int64(stmt_, idx, value); }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int col) const {
        const unsigned char* v = sqlite3_column_text(stmt_, col);
        return v ? reinterpret_cast<const char*>(v) : "";
    }
    int64_t int64(int col) const { return sqlite3_column_int64(stmt_, col); }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

SqliteSessionStore::SqliteSessionStore(const std::string& path) {
    if (sqlite3_open_v2(path.c_str(), &db_,
                        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                        nullptr) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open session database '" + path + "': " + err);
    }

    try {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
        migrate();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    spdlog::info("Session records: {}", path);
}

SqliteSessionStore::~SqliteSessionStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteSessionStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("sqlite exec failed: " + msg);
    }
}

void SqliteSessionStore::migrate() {
    exec("CREATE TABLE IF NOT EXISTS abr_sessions ("
         " session_id TEXT PRIMARY KEY,"
         " stream_key TEXT NOT NULL,"
         " started_at INTEGER NOT NULL,"
         " ended_at INTEGER NOT NULL DEFAULT 0,"
         " end_reason TEXT NOT NULL DEFAULT '');");
    exec("CREATE TABLE IF NOT EXISTS abr_variants ("
         " session_id TEXT NOT NULL,"
         " variant TEXT NOT NULL,"
         " status TEXT NOT NULL,"
         " detail TEXT NOT NULL DEFAULT '',"
         " updated_at INTEGER NOT NULL,"
         " PRIMARY KEY (session_id, variant));");
    exec("CREATE INDEX IF NOT EXISTS idx_abr_sessions_stream ON abr_sessions(stream_key);");
}

void SqliteSessionStore::session_started(const std::string& session_id,
                                         const std::string& stream_key,
                                         int64_t started_at_ms) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO abr_sessions (session_id, stream_key, started_at)"
                        " VALUES (?, ?, ?);");
    stmt.bind(1, session_id);
    stmt.bind(2, stream_key);
    stmt.bind(3, started_at_ms);
    if (stmt.step() != SQLITE_DONE) {
        throw std::runtime_error("Failed to record session start: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteSessionStore::session_ended(const std::string& session_id, const std::string& reason,
                                       int64_t ended_at_ms) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "UPDATE abr_sessions SET ended_at = ?, end_reason = ? WHERE session_id = ?;");
    stmt.bind(1, ended_at_ms);
    stmt.bind(2, reason);
    stmt.bind(3, session_id);
    if (stmt.step() != SQLITE_DONE) {
        throw std::runtime_error("Failed to record session end: " + std::string(sqlite3_errmsg(db_)));
    }
}

void SqliteSessionStore::variant_status(const std::string& session_id, const std::string& variant,
                                        const std::string& status, const std::string& detail) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "INSERT OR REPLACE INTO abr_variants"
                        " (session_id, variant, status, detail, updated_at) VALUES (?, ?, ?, ?, ?);");
    stmt.bind(1, session_id);
    stmt.bind(2, variant);
    stmt.bind(3, status);
    stmt.bind(4, detail);
    stmt.bind(5, now_epoch_ms());
    if (stmt.step() != SQLITE_DONE) {
        throw std::runtime_error("Failed to record variant status: " + std::string(sqlite3_errmsg(db_)));
    }
}

std::vector<SessionRecord> SqliteSessionStore::recent_sessions(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "SELECT session_id, stream_key, started_at, ended_at, end_reason"
                        " FROM abr_sessions ORDER BY started_at DESC LIMIT ?;");
    stmt.bind(1, static_cast<int64_t>(limit));

    std::vector<SessionRecord> out;
    while (stmt.step() == SQLITE_ROW) {
        SessionRecord r;
        r.session_id = stmt.text(0);
        r.stream_key = stmt.text(1);
        r.started_at_ms = stmt.int64(2);
        r.ended_at_ms = stmt.int64(3);
        r.end_reason = stmt.text(4);
        out.push_back(std::move(r));
    }
    return out;
}

std::vector<VariantRecord> SqliteSessionStore::variants_for(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    Statement stmt(db_, "SELECT session_id, variant, status, detail, updated_at"
                        " FROM abr_variants WHERE session_id = ? ORDER BY variant;");
    stmt.bind(1, session_id);

    std::vector<VariantRecord> out;
    while (stmt.step() == SQLITE_ROW) {
        VariantRecord r;
        r.session_id = stmt.text(0);
        r.variant = stmt.text(1);
        r.status = stmt.text(2);
        r.detail = stmt.text(3);
        r.updated_at_ms = stmt.int64(4);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace sdc
