#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// Standard (RFC 4648) base64 with '=' padding.
namespace base64 {

inline std::string encode(std::span<const uint8_t> data) {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(4 * ((data.size() + 2) / 3));

    for (size_t i = 0; i < data.size(); i += 3) {
        uint32_t v = uint32_t(data[i]) << 16;
        if (i + 1 < data.size()) v |= uint32_t(data[i + 1]) << 8;
        if (i + 2 < data.size()) v |= data[i + 2];

        out += alphabet[(v >> 18) & 0x3F];
        out += alphabet[(v >> 12) & 0x3F];
        out += (i + 1 < data.size()) ? alphabet[(v >> 6) & 0x3F] : '=';
        out += (i + 2 < data.size()) ? alphabet[v & 0x3F] : '=';
    }
    return out;
}

inline std::string encode(std::string_view text) {
    return encode(std::span(reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

} // namespace base64
