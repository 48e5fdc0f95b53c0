#pragma once

#include <shortid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace shortid {

// 128-bit identifier. `bytes` holds the RFC 4122 (big-endian) order, i.e.
// the order the hex digits appear in the 36-char text form.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();
    static Uuid nil() { return Uuid{}; }
    bool is_nil() const;

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;
    static Result<Uuid> from_string(std::string_view s);

    // GUID memory layout: time_low, time_mid and time_hi_and_version are
    // stored little-endian, the trailing 8 bytes as-is. This is the native
    // layout the short id codec encodes.
    std::array<uint8_t, 16> guid_bytes() const;
    static Uuid from_guid_bytes(const std::array<uint8_t, 16>& raw);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;

    size_t hash() const;
};

} // namespace shortid

namespace std {
template<>
struct hash<shortid::Uuid> {
    size_t operator()(const shortid::Uuid& u) const { return u.hash(); }
};
} // namespace std
