#pragma once

#include "call/call_types.hpp"
#include "net/http_fetcher.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace voxcall {

// Read-only listing of past sessions from the server's REST API. A failed
// fetch is logged and leaves the previous listing in place. When requests
// overlap, a response never replaces a listing from a later request.
class SessionDirectory {
public:
    using UpdateCallback = std::function<void(const std::vector<SessionRecord>&)>;

    SessionDirectory(HttpFetcher& fetcher, std::string apiUrl);

    void listSessions();

    const std::vector<SessionRecord>& sessions() const { return sessions_; }
    bool loading() const { return inFlight_ > 0; }

    void setUpdateCallback(UpdateCallback callback) { updateCallback_ = std::move(callback); }

    // Parses the /sessions response body; nullopt if it is not an array of
    // records with string ids.
    static std::optional<std::vector<SessionRecord>> parseListing(const std::string& body);

private:
    HttpFetcher& fetcher_;
    std::string apiUrl_;
    std::vector<SessionRecord> sessions_;
    int inFlight_{0};
    // Requests are numbered; a response older than the applied one is stale.
    std::uint64_t nextRequest_{0};
    std::uint64_t appliedRequest_{0};
    UpdateCallback updateCallback_;
    std::shared_ptr<char> alive_{std::make_shared<char>(0)};
};

} // namespace voxcall
