#include <shortid/uuid.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <random>

namespace shortid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- UUID v4 ----

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    // version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

bool Uuid::is_nil() const {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

// ---- Text form ----

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::from_string(std::string_view s) {
    if (s.size() != 36) {
        return ShortIdError(ShortIdError::Parse,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx")
            .with_input(std::string(s));
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return ShortIdError(ShortIdError::Parse,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23")
            .with_input(std::string(s));
    }

    // Offset of each byte's high nibble; dashes sit only at 8, 13, 18, 23
    static constexpr size_t hex_offsets[16] = {
        0, 2, 4, 6, 9, 11, 14, 16, 19, 21, 24, 26, 28, 30, 32, 34
    };

    Uuid u;
    for (size_t b = 0; b < 16; ++b) {
        size_t i = hex_offsets[b];
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return ShortIdError(ShortIdError::Parse,
                "UUID string contains invalid hex character",
                "Invalid char at position " + std::to_string(hi < 0 ? i : i + 1))
                .with_input(std::string(s));
        }
        u.bytes[b] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<Uuid>::ok(u);
}

// ---- GUID layout ----
// Swapping the three leading fields is its own inverse, so both directions
// share one permutation.

static constexpr int guid_order[16] = {
    3, 2, 1, 0,   // time_low
    5, 4,         // time_mid
    7, 6,         // time_hi_and_version
    8, 9, 10, 11, 12, 13, 14, 15
};

std::array<uint8_t, 16> Uuid::guid_bytes() const {
    std::array<uint8_t, 16> raw;
    for (int i = 0; i < 16; ++i) {
        raw[i] = bytes[guid_order[i]];
    }
    return raw;
}

Uuid Uuid::from_guid_bytes(const std::array<uint8_t, 16>& raw) {
    Uuid u;
    for (int i = 0; i < 16; ++i) {
        u.bytes[guid_order[i]] = raw[i];
    }
    return u;
}

// ---- Comparison ----

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

size_t Uuid::hash() const {
    uint64_t hi, lo;
    std::memcpy(&hi, bytes.data(), 8);
    std::memcpy(&lo, bytes.data() + 8, 8);
    return std::hash<uint64_t>{}(hi ^ (lo * 0x9e3779b97f4a7c15ULL));
}

} // namespace shortid
