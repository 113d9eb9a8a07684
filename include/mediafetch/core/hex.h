#pragma once

#include <mediafetch/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace mediafetch {

inline std::string toHexLower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

inline std::string toHexLower(ByteSpan bytes) {
    return toHexLower(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
}

// Accepts upper or lower case; rejects odd lengths and non-hex characters.
inline Result<ByteVector> fromHex(std::string_view hex) {
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return c - 'a' + 10;
        if (c >= 'A' && c <= 'F')
            return c - 'A' + 10;
        return -1;
    };
    if (hex.size() % 2 != 0) {
        return Error{ErrorCode::InvalidArgument, "hex string has odd length"};
    }
    ByteVector out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int hi = nibble(hex[i]);
        int lo = nibble(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::InvalidArgument, "invalid hex character"};
        }
        out.push_back(static_cast<std::byte>((hi << 4) | lo));
    }
    return out;
}

} // namespace mediafetch
