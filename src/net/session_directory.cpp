#include "net/session_directory.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace voxcall {

SessionDirectory::SessionDirectory(HttpFetcher& fetcher, std::string apiUrl)
    : fetcher_(fetcher)
    , apiUrl_(std::move(apiUrl)) {
    while (!apiUrl_.empty() && apiUrl_.back() == '/') apiUrl_.pop_back();
}

void SessionDirectory::listSessions() {
    ++inFlight_;
    const std::uint64_t request = ++nextRequest_;
    std::weak_ptr<char> alive = alive_;
    fetcher_.get(apiUrl_ + "/sessions", [this, alive, request](std::optional<std::string> body, std::string error) {
        if (alive.expired()) return;
        --inFlight_;
        if (request < appliedRequest_) {
            std::cerr << "Warning: ignoring stale session listing" << std::endl;
            return;
        }
        if (!body) {
            std::cerr << "Warning: failed to load sessions: " << error << std::endl;
            return;
        }
        auto listing = parseListing(*body);
        if (!listing) {
            std::cerr << "Warning: failed to load sessions: unexpected response body" << std::endl;
            return;
        }
        appliedRequest_ = request;
        sessions_ = std::move(*listing);
        if (updateCallback_) updateCallback_(sessions_);
    });
}

std::optional<std::vector<SessionRecord>> SessionDirectory::parseListing(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded() || !json.is_array()) {
        return std::nullopt;
    }

    auto optionalString = [](const nlohmann::json& j, const char* key) -> std::optional<std::string> {
        if (!j.contains(key) || !j[key].is_string()) return std::nullopt;
        return j[key].get<std::string>();
    };

    std::vector<SessionRecord> out;
    out.reserve(json.size());
    for (const auto& item : json) {
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            return std::nullopt;
        }
        SessionRecord record;
        record.id = item["id"].get<std::string>();
        record.status = optionalString(item, "status").value_or("unknown");
        record.createdAt = optionalString(item, "created_at");
        record.endedAt = optionalString(item, "ended_at");
        out.push_back(std::move(record));
    }
    return out;
}

} // namespace voxcall
