#pragma once
#include "call/call_types.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <string>

namespace voxcall {

// Local record of calls and per-turn latency.
// Schema:
//  - calls(session_id TEXT PK, started_ms INTEGER, ended_ms INTEGER)
//  - turns(id INTEGER PK, session_id TEXT, logged_ms INTEGER, transcript TEXT,
//          assistant_text TEXT, stt_partial_ms INTEGER, stt_final_ms INTEGER,
//          first_audio_ms INTEGER)
//
// Notes:
//  * Times are wall-clock millis since the epoch.
//  * Not thread-safe; used from the event loop only.
class CallJournal {
public:
    explicit CallJournal(const std::string& db_path);
    ~CallJournal();

    CallJournal(const CallJournal&) = delete;
    CallJournal& operator=(const CallJournal&) = delete;

    void beginCall(const std::string& session_id);
    void endCall(const std::string& session_id);

    // Writes one finished turn. Returns false if the insert failed.
    bool logTurn(const std::string& session_id, const Turn& turn, const LatencyRecord& latency);

    std::int64_t turnCount(const std::string& session_id) const;

    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    static std::int64_t now_ms();

    std::string db_path_;
    sqlite3* db_ = nullptr;
};

} // namespace voxcall
