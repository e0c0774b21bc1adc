#include "base64.hpp"
#include <array>
#include <cctype>

static const char ALPHABET[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const uint8_t* data, size_t size) {
    std::string out;
    out.reserve((size + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < size; i += 3) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | data[i + 2];
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out.push_back(ALPHABET[(n >> 6) & 63]);
        out.push_back(ALPHABET[n & 63]);
    }
    size_t rest = size - i;
    if (rest == 1) {
        uint32_t n = uint32_t(data[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out.push_back(ALPHABET[(n >> 6) & 63]);
        out.push_back('=');
    }
    return out;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

static std::array<int8_t, 256> make_lookup() {
    std::array<int8_t, 256> table;
    table.fill(-1);
    for (int i = 0; i < 64; ++i) table[static_cast<unsigned char>(ALPHABET[i])] = static_cast<int8_t>(i);
    return table;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& text) {
    static const std::array<int8_t, 256> lookup = make_lookup();
    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);
    uint32_t acc = 0;
    int bits = 0;
    size_t symbols = 0;
    size_t padding = 0;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt; // data after padding
        int8_t v = lookup[c];
        if (v < 0) return std::nullopt;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++symbols;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (padding > 2) return std::nullopt;
    if (symbols % 4 == 1) return std::nullopt;
    if (padding > 0 && (symbols + padding) % 4 != 0) return std::nullopt;
    return out;
}
