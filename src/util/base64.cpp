#include "util/base64.hpp"
#include <array>
#include <cctype>

namespace voxcall {

static const std::string b64_table =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static std::array<int, 256> buildReverseTable() {
    std::array<int, 256> rev{};
    rev.fill(-1);
    for (std::size_t i = 0; i < b64_table.size(); ++i) {
        rev[static_cast<unsigned char>(b64_table[i])] = static_cast<int>(i);
    }
    return rev;
}

std::optional<std::vector<std::uint8_t>> base64Decode(const std::string& text) {
    static const std::array<int, 256> rev = buildReverseTable();

    std::vector<std::uint8_t> out;
    out.reserve(text.size() * 3 / 4);

    int val = 0, valb = -8;
    std::size_t padding = 0;
    std::size_t symbols = 0;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        // data after padding
        if (padding > 0) return std::nullopt;
        int d = rev[c];
        if (d < 0) return std::nullopt;
        ++symbols;
        val = ((val << 6) + d) & 0xFFFF;
        valb += 6;
        if (valb >= 0) {
            out.push_back(static_cast<std::uint8_t>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    if (padding > 2 || (symbols + padding) % 4 == 1) return std::nullopt;
    if (padding > 0 && (symbols + padding) % 4 != 0) return std::nullopt;
    return out;
}

std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
    std::string ret;
    ret.reserve(((bytes.size() + 2) / 3) * 4);
    int val = 0, valb = -6;
    for (std::uint8_t b : bytes) {
        val = ((val << 8) + b) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            ret.push_back(b64_table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) ret.push_back(b64_table[((val << 8) >> (valb + 8)) & 0x3F]);
    while (ret.size() % 4) ret.push_back('=');
    return ret;
}

} // namespace voxcall
