#include <shortid/base64.hpp>
#include <string>

namespace shortid::base64 {

static constexpr char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int sextet(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

Chars encode_block(const Block& raw) {
    Chars out;
    size_t o = 0;
    // 5 full groups: 15 bytes -> 20 chars
    for (size_t i = 0; i < 15; i += 3) {
        uint32_t triple = (uint32_t(raw[i]) << 16) | (uint32_t(raw[i + 1]) << 8) | raw[i + 2];
        out[o++] = alphabet[(triple >> 18) & 0x3F];
        out[o++] = alphabet[(triple >> 12) & 0x3F];
        out[o++] = alphabet[(triple >> 6) & 0x3F];
        out[o++] = alphabet[triple & 0x3F];
    }
    // trailing byte -> 2 chars + "=="
    out[o++] = alphabet[raw[15] >> 2];
    out[o++] = alphabet[(raw[15] & 0x03) << 4];
    out[o++] = '=';
    out[o++] = '=';
    return out;
}

Result<Block> decode_block(const Chars& chars) {
    if (chars[22] != '=' || chars[23] != '=') {
        return ShortIdError(ShortIdError::Format,
            "base64 block must end with \"==\" padding")
            .with_input(std::string(chars.begin(), chars.end()));
    }

    int vals[22];
    for (size_t i = 0; i < 22; ++i) {
        vals[i] = sextet(chars[i]);
        if (vals[i] < 0) {
            return ShortIdError(ShortIdError::Format,
                "invalid base64 character",
                "unexpected '" + std::string(1, chars[i]) + "' at position " + std::to_string(i))
                .with_input(std::string(chars.begin(), chars.end()));
        }
    }

    Block raw;
    size_t o = 0;
    for (size_t i = 0; i < 20; i += 4) {
        uint32_t quad = (uint32_t(vals[i]) << 18) | (uint32_t(vals[i + 1]) << 12)
                      | (uint32_t(vals[i + 2]) << 6) | uint32_t(vals[i + 3]);
        raw[o++] = static_cast<uint8_t>(quad >> 16);
        raw[o++] = static_cast<uint8_t>(quad >> 8);
        raw[o++] = static_cast<uint8_t>(quad);
    }
    raw[o] = static_cast<uint8_t>((vals[20] << 2) | (vals[21] >> 4));
    return Result<Block>::ok(raw);
}

} // namespace shortid::base64
