#include "core/base64.hpp"

#include <array>

namespace nbfs::base64 {

namespace {

constexpr char ALPHABET[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<int, 256> make_decode_table() {
    std::array<int, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 64; i++) {
        table[static_cast<unsigned char>(ALPHABET[i])] = i;
    }
    return table;
}

constexpr auto DECODE_TABLE = make_decode_table();

bool is_space(char c) {
    return c == ' ' || c == '\n' || c == '\r' || c == '\t';
}

} // namespace

Result<std::string> decode(std::string_view text) {
    std::string out;
    out.reserve(text.size() / 4 * 3);

    unsigned int accum = 0;
    int bits = 0;
    size_t padding = 0;

    for (char c : text) {
        if (is_space(c)) continue;
        if (c == '=') {
            padding++;
            continue;
        }
        if (padding > 0) {
            return Error(ErrorKind::ParseError,
                         "base64: data after padding");
        }
        int v = DECODE_TABLE[static_cast<unsigned char>(c)];
        if (v < 0) {
            return Error(ErrorKind::ParseError,
                         std::string("base64: invalid character '") + c + "'");
        }
        accum = (accum << 6) | static_cast<unsigned int>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((accum >> bits) & 0xFF));
        }
    }

    // 6 leftover bits can never come from a valid encoding
    if (bits >= 6 || padding > 2) {
        return Error(ErrorKind::ParseError, "base64: truncated input");
    }

    return out;
}

std::string encode(std::string_view bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        unsigned int n = (static_cast<unsigned char>(bytes[i]) << 16) |
                         (static_cast<unsigned char>(bytes[i + 1]) << 8) |
                         static_cast<unsigned char>(bytes[i + 2]);
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out.push_back(ALPHABET[(n >> 6) & 63]);
        out.push_back(ALPHABET[n & 63]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        unsigned int n = static_cast<unsigned char>(bytes[i]) << 16;
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out += "==";
    } else if (rest == 2) {
        unsigned int n = (static_cast<unsigned char>(bytes[i]) << 16) |
                         (static_cast<unsigned char>(bytes[i + 1]) << 8);
        out.push_back(ALPHABET[(n >> 18) & 63]);
        out.push_back(ALPHABET[(n >> 12) & 63]);
        out.push_back(ALPHABET[(n >> 6) & 63]);
        out.push_back('=');
    }

    return out;
}

} // namespace nbfs::base64
