#pragma once

#include <shortid/result.hpp>
#include <array>
#include <cstdint>

namespace shortid::base64 {

// Fixed-size Base64 (RFC 4648 standard alphabet) for a single 16-byte
// identifier: 16 bytes <-> 22 significant characters + "==".
using Block = std::array<uint8_t, 16>;
using Chars = std::array<char, 24>;

Chars encode_block(const Block& raw);

// Non-strict: the 4 unused bits carried by the 22nd character are dropped,
// so several inputs may decode to the same block. Fails with Format on any
// character outside the alphabet or if the padding is not exactly "==".
Result<Block> decode_block(const Chars& chars);

// '+' <-> '-' and '/' <-> '_'; everything else passes through
inline char to_url_safe(char c) {
    return c == '+' ? '-' : c == '/' ? '_' : c;
}

inline char from_url_safe(char c) {
    return c == '-' ? '+' : c == '_' ? '/' : c;
}

} // namespace shortid::base64
