#pragma once

#include <functional>
#include <optional>
#include <string>

namespace voxcall {

class HttpFetcher {
public:
    // body is set on a 2xx response; otherwise error describes the failure.
    using FetchCallback = std::function<void(std::optional<std::string> body, std::string error)>;

    virtual ~HttpFetcher() = default;

    // GET <url>; completes on the event loop.
    virtual void get(const std::string& url, FetchCallback done) = 0;
};

} // namespace voxcall
