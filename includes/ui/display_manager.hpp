#pragma once

#include "call/voice_client.hpp"
#include "net/session_directory.hpp"
#include <chrono>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace voxcall {

// Full-screen console rendering of the client. Runs on the event loop.
class DisplayManager {
public:
    enum class View { Call, Trace, Sessions };

    static constexpr std::size_t SHORT_ID_LENGTH = 8;

    DisplayManager(const VoiceClient& client, const SessionDirectory& sessions)
        : client_(client)
        , sessions_(sessions)
        , lastUpdate_(std::chrono::steady_clock::now())
    {}

    View view() const { return view_; }

    void setView(View view) {
        view_ = view;
        requestUpdate();
    }

    void toggleTrace() { setView(view_ == View::Trace ? View::Call : View::Trace); }

    void requestUpdate() { needsUpdate_ = true; }

    // Redraws when something changed, at most every MIN_INTERVAL_MS unless forced.
    void updateDisplay(bool force = false) {
        auto currentTime = std::chrono::steady_clock::now();
        auto sinceLast = std::chrono::duration_cast<std::chrono::milliseconds>(
            currentTime - lastUpdate_).count();
        if (!force && (!needsUpdate_ || sinceLast < MIN_INTERVAL_MS)) return;

        // Clear screen and reset cursor
        std::cout << "\033[2J\033[H";
        std::cout << "=== voxcall ===\n";
        std::cout << "Status: \033[1m" << client_.statusLabel() << "\033[0m";
        if (client_.capturing()) std::cout << "  \033[31m[REC]\033[0m";
        std::cout << "\n";

        const Call* call = client_.call();
        if (call && call->sessionId) {
            std::cout << "Session: " << shortId(*call->sessionId) << "\n";
        }
        std::cout << "-------------------\n\n";

        switch (view_) {
        case View::Call: renderCall(call); break;
        case View::Trace: renderTrace(call); break;
        case View::Sessions: renderSessions(); break;
        }

        if (client_.errors().active()) {
            std::cout << "\n\033[31mError: " << client_.errors().message() << "\033[0m\n";
        }

        std::cout << "\n\033[2m[c] call  [space] talk  [h] hang up  [t] trace  [s] sessions  [q] quit\033[0m\n";
        std::cout << std::flush;

        lastUpdate_ = currentTime;
        needsUpdate_ = false;
    }

    static std::string shortId(const std::string& id) {
        return id.size() > SHORT_ID_LENGTH ? id.substr(0, SHORT_ID_LENGTH) : id;
    }

    static std::string formatMs(const std::optional<std::int64_t>& ms) {
        return ms ? std::to_string(*ms) + " ms" : std::string("-");
    }

    // "STT:380ms | Audio:900ms", with "-" for a missing side.
    static std::string formatBreakdown(const LatencyBreakdown& latency) {
        auto side = [](const std::optional<std::int64_t>& ms) {
            return ms ? std::to_string(*ms) + "ms" : std::string("-");
        };
        return "STT:" + side(latency.sttMs) + " | Audio:" + side(latency.firstAudioMs);
    }

private:
    static constexpr long long MIN_INTERVAL_MS = 50;

    const VoiceClient& client_;
    const SessionDirectory& sessions_;
    View view_{View::Call};
    bool needsUpdate_{true};
    std::chrono::steady_clock::time_point lastUpdate_;

    void renderCall(const Call* call) {
        if (!call) {
            std::cout << "Press c to start a call.\n";
            return;
        }

        const Turn& turn = call->turn;
        std::cout << "\033[1mYou:\033[0m\n";
        if (turn.finalReceived) {
            std::cout << turn.sttFinal << "\n\n";
        } else if (!turn.sttPartial.empty()) {
            std::cout << "\033[2m" << turn.sttPartial << "\033[0m\n\n";
        } else {
            std::cout << "-\n\n";
        }

        std::cout << "\033[1mAssistant:\033[0m\n";
        std::cout << (turn.assistantText.empty() ? std::string("-") : turn.assistantText);
        if (!turn.assistantText.empty() && !turn.assistantComplete) std::cout << " ...";
        std::cout << "\n\n";

        const LatencyRecord& latency = call->latency.record();
        std::cout << "\033[1mLatency:\033[0m\n";
        std::cout << "  first partial  " << formatMs(latency.sttPartialMs) << "\n";
        std::cout << "  final          " << formatMs(latency.sttFinalMs) << "\n";
        std::cout << "  first audio    " << formatMs(latency.firstAudioMs) << "\n";
    }

    void renderTrace(const Call* call) {
        std::cout << "\033[1mTrace\033[0m (newest first)\n";
        if (!call || call->trace.size() == 0) {
            std::cout << "(no events)\n";
            return;
        }
        for (const TraceEvent& e : call->trace.events()) {
            std::cout << e.wallTime << "  " << std::left << std::setw(22) << e.event << std::right;
            if (e.latencyMs) std::cout << " " << *e.latencyMs << " ms";
            if (e.transcript) std::cout << "  \"" << *e.transcript << "\"";
            if (e.latency) std::cout << "  [" << formatBreakdown(*e.latency) << "]";
            std::cout << "\n";
        }
    }

    void renderSessions() {
        std::cout << "\033[1mSessions\033[0m";
        if (sessions_.loading()) std::cout << " (loading)";
        std::cout << "\n";
        if (sessions_.sessions().empty()) {
            std::cout << "(none)\n";
            return;
        }
        for (const SessionRecord& s : sessions_.sessions()) {
            std::cout << shortId(s.id) << "  " << std::left << std::setw(10) << s.status << std::right
                      << "  " << s.createdAt.value_or("-");
            if (s.endedAt) std::cout << " -> " << *s.endedAt;
            std::cout << "\n";
        }
    }
};

} // namespace voxcall
