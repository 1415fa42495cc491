#include "storage/call_journal.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace voxcall {

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

static sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        std::cerr << "Warning: journal prepare failed: " << sqlite3_errmsg(db) << std::endl;
        sqlite3_finalize(st);
        return nullptr;
    }
    return st;
}

static void bind_optional(sqlite3_stmt* st, int idx, const std::optional<std::int64_t>& v) {
    if (v) sqlite3_bind_int64(st, idx, *v);
    else   sqlite3_bind_null(st, idx);
}

CallJournal::CallJournal(const std::string& db_path)
    : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path);
    }
    init_schema();
}

CallJournal::~CallJournal() {
    if (db_) sqlite3_close(db_);
}

void CallJournal::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS calls (
        session_id TEXT PRIMARY KEY,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER
    );
    CREATE TABLE IF NOT EXISTS turns (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id TEXT NOT NULL,
        logged_ms INTEGER NOT NULL,
        transcript TEXT,
        assistant_text TEXT,
        stt_partial_ms INTEGER,
        stt_final_ms INTEGER,
        first_audio_ms INTEGER,
        FOREIGN KEY(session_id) REFERENCES calls(session_id)
    );
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t CallJournal::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

void CallJournal::beginCall(const std::string& session_id) {
    sqlite3_stmt* st = prepare(db_, "INSERT OR IGNORE INTO calls (session_id, started_ms) VALUES (?, ?);");
    if (!st) return;
    sqlite3_bind_text(st, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, now_ms());
    if (sqlite3_step(st) != SQLITE_DONE) {
        std::cerr << "Warning: journal could not record call " << session_id
                  << ": " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(st);
}

void CallJournal::endCall(const std::string& session_id) {
    sqlite3_stmt* st = prepare(db_, "UPDATE calls SET ended_ms=? WHERE session_id=?;");
    if (!st) return;
    sqlite3_bind_int64(st, 1, now_ms());
    sqlite3_bind_text(st, 2, session_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(st) != SQLITE_DONE) {
        std::cerr << "Warning: journal could not close call " << session_id
                  << ": " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(st);
}

bool CallJournal::logTurn(const std::string& session_id, const Turn& turn, const LatencyRecord& latency) {
    sqlite3_stmt* st = prepare(db_,
        "INSERT INTO turns (session_id, logged_ms, transcript, assistant_text, "
        "stt_partial_ms, stt_final_ms, first_audio_ms) VALUES (?, ?, ?, ?, ?, ?, ?);");
    if (!st) return false;
    sqlite3_bind_text(st, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st, 2, now_ms());
    sqlite3_bind_text(st, 3, turn.sttFinal.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st, 4, turn.assistantText.c_str(), -1, SQLITE_TRANSIENT);
    bind_optional(st, 5, latency.sttPartialMs);
    bind_optional(st, 6, latency.sttFinalMs);
    bind_optional(st, 7, latency.firstAudioMs);
    const bool ok = sqlite3_step(st) == SQLITE_DONE;
    if (!ok) {
        std::cerr << "Warning: journal could not record turn: " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(st);
    return ok;
}

std::int64_t CallJournal::turnCount(const std::string& session_id) const {
    sqlite3_stmt* st = prepare(db_, "SELECT COUNT(*) FROM turns WHERE session_id=?;");
    if (!st) return 0;
    sqlite3_bind_text(st, 1, session_id.c_str(), -1, SQLITE_TRANSIENT);
    std::int64_t count = 0;
    if (sqlite3_step(st) == SQLITE_ROW) {
        count = sqlite3_column_int64(st, 0);
    }
    sqlite3_finalize(st);
    return count;
}

} // namespace voxcall
