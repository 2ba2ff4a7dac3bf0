#include "base64.hpp"
#include <array>

static const char b64_chars[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz"
    "0123456789+/";

static std::string encode_bytes(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);
    size_t i = 0;
    for (; i + 2 < len; i += 3) {
        uint32_t v = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(b64_chars[(v >> 18) & 0x3F]);
        out.push_back(b64_chars[(v >> 12) & 0x3F]);
        out.push_back(b64_chars[(v >> 6) & 0x3F]);
        out.push_back(b64_chars[v & 0x3F]);
    }
    if (i < len) {
        uint32_t v = uint32_t(data[i]) << 16;
        if (i + 1 < len) v |= uint32_t(data[i + 1]) << 8;
        out.push_back(b64_chars[(v >> 18) & 0x3F]);
        out.push_back(b64_chars[(v >> 12) & 0x3F]);
        out.push_back(i + 1 < len ? b64_chars[(v >> 6) & 0x3F] : '=');
        out.push_back('=');
    }
    return out;
}

std::string base64_encode(const std::string& text) {
    return encode_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string base64_decode(const std::string& s) {
    std::array<int, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) table[static_cast<uint8_t>(b64_chars[i])] = i;

    std::string out;
    int val = 0, bits = -8;
    for (uint8_t c : s) {
        if (table[c] == -1) break;
        val = ((val << 6) | table[c]) & 0xFFFFFF;
        bits += 6;
        if (bits >= 0) {
            out.push_back(char((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}
