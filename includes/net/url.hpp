#pragma once

#include <optional>
#include <string>

namespace voxcall {

struct Url {
    std::string scheme;   // lower-case
    std::string host;
    std::string port;     // defaulted from the scheme when absent
    std::string target;   // path plus query, at least "/"
};

// Accepts ws, wss, http and https URLs. nullopt when the text is not one.
std::optional<Url> parseUrl(const std::string& text);

} // namespace voxcall
