#include <pmd/utils.hh>

#include <string>
#include <string_view>

void pmd::utils::ReplaceAny(std::string& str, std::string_view chars, char with) {
    for (auto& c : str)
        if (chars.contains(c))
            c = with;
}

namespace {
constexpr std::string_view base64_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr auto Base64Value(char c) -> int {
    if (c >= 'A' and c <= 'Z') return c - 'A';
    if (c >= 'a' and c <= 'z') return c - 'a' + 26;
    if (c >= '0' and c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}
} // namespace

auto pmd::utils::Base64Encode(std::span<const u8> bytes) -> std::string {
    std::string out{};
    out.reserve((bytes.size() + 2) / 3 * 4);

    usz i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        u32 chunk = u32(bytes[i]) << 16 | u32(bytes[i + 1]) << 8 | u32(bytes[i + 2]);
        out += base64_alphabet[(chunk >> 18) & 0x3F];
        out += base64_alphabet[(chunk >> 12) & 0x3F];
        out += base64_alphabet[(chunk >> 6) & 0x3F];
        out += base64_alphabet[chunk & 0x3F];
    }

    // One or two bytes left over.
    if (auto rest = bytes.size() - i; rest != 0) {
        u32 chunk = u32(bytes[i]) << 16;
        if (rest == 2) chunk |= u32(bytes[i + 1]) << 8;
        out += base64_alphabet[(chunk >> 18) & 0x3F];
        out += base64_alphabet[(chunk >> 12) & 0x3F];
        out += rest == 2 ? base64_alphabet[(chunk >> 6) & 0x3F] : '=';
        out += '=';
    }

    return out;
}

auto pmd::utils::Base64Decode(std::string_view text) -> std::optional<std::vector<u8>> {
    if (text.size() % 4 != 0) return std::nullopt;

    std::vector<u8> out{};
    out.reserve(text.size() / 4 * 3);
    for (usz i = 0; i < text.size(); i += 4) {
        auto quad = text.substr(i, 4);
        bool last = i + 4 == text.size();

        // Padding may only appear at the end of the last quad.
        usz padding = 0;
        if (last and quad[3] == '=') padding = quad[2] == '=' ? 2 : 1;

        u32 chunk = 0;
        for (usz j = 0; j < 4; ++j) {
            if (j >= 4 - padding) {
                chunk <<= 6;
                continue;
            }
            int v = Base64Value(quad[j]);
            if (v < 0) return std::nullopt;
            chunk = chunk << 6 | u32(v);
        }

        out.push_back(u8(chunk >> 16));
        if (padding < 2) out.push_back(u8(chunk >> 8));
        if (padding < 1) out.push_back(u8(chunk));
    }

    return out;
}
