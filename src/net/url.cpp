#include "net/url.hpp"
#include <algorithm>
#include <cctype>

namespace voxcall {

std::optional<Url> parseUrl(const std::string& text) {
    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) return std::nullopt;

    Url url;
    url.scheme = text.substr(0, schemeEnd);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::string defaultPort;
    if (url.scheme == "ws" || url.scheme == "http") defaultPort = "80";
    else if (url.scheme == "wss" || url.scheme == "https") defaultPort = "443";
    else return std::nullopt;

    const auto authorityStart = schemeEnd + 3;
    auto pathStart = text.find_first_of("/?", authorityStart);
    std::string authority = text.substr(authorityStart, pathStart == std::string::npos
                                                            ? std::string::npos
                                                            : pathStart - authorityStart);
    if (authority.empty()) return std::nullopt;

    url.target = pathStart == std::string::npos ? "/" : text.substr(pathStart);
    if (url.target.front() == '?') url.target.insert(0, "/");

    // Bracketed IPv6 literal.
    if (authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        url.host = authority.substr(1, close - 1);
        const std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':' || rest.size() == 1) return std::nullopt;
            url.port = rest.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon == std::string::npos) {
            url.host = authority;
        } else {
            url.host = authority.substr(0, colon);
            url.port = authority.substr(colon + 1);
            if (url.port.empty()) return std::nullopt;
        }
    }

    if (url.host.empty()) return std::nullopt;
    if (!std::all_of(url.port.begin(), url.port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    if (url.port.empty()) url.port = defaultPort;
    return url;
}

} // namespace voxcall
