#pragma once

#include <shortid/result.hpp>
#include <shortid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace shortid {

constexpr size_t kShortIdLength = 22;
constexpr size_t kUuidTextLength = 36;

// Encoding of the nil uuid (16 zero bytes)
constexpr std::string_view kEmptyText = "AAAAAAAAAAAAAAAAAAAAAA";

// ---- Codec ----

// Base64 of Uuid::guid_bytes() with '+' -> '-', '/' -> '_' and the "=="
// padding dropped. Always 22 characters.
std::string encode(const Uuid& id);

// Parses a 36-char uuid, then encodes it. Fails with Parse.
Result<std::string> encode(std::string_view uuid_text);

// Strict decode. Fails with Length unless the input is exactly 22
// characters, and with Format if it is not base64 or does not re-encode to
// exactly the same text (non-zero trailing bits, '+' or '/' in the input).
Result<Uuid> decode(std::string_view text);

// As decode(), but reports failure by returning false and setting `out` to
// the nil uuid.
bool try_decode(std::string_view text, Uuid& out);

class ShortId;

// Accepts a 22-char short id or a 36-char uuid; any other length fails
// immediately. On failure `out` is set to the empty value.
bool try_parse(std::string_view text, ShortId& out);
bool try_parse(std::string_view text, Uuid& out);

// Right-hand operands ShortId::equals() understands. std::nullopt stands for
// an absent value.
using Comparand = std::variant<std::nullopt_t, Uuid, ShortId, std::string_view>;

// ---- ShortId ----

// Immutable uuid + cached 22-char text. text() == encode(uuid()) for every
// instance. Default construction yields the empty value.
class ShortId {
public:
    ShortId();

    static ShortId from_uuid(const Uuid& id);
    // Strict decode of a 22-char short id
    static Result<ShortId> from_text(std::string_view text);
    // Empty text -> empty(); otherwise either form via try_parse(). Fails
    // with Format.
    static Result<ShortId> coerce(std::string_view text);

    static const ShortId& empty();
    static ShortId generate();

    const Uuid& uuid() const { return id_; }
    const std::string& text() const { return text_; }
    bool is_empty() const { return id_.is_nil(); }

    // Text operands: strict decode first, then 36-char uuid parsing; a text
    // that is neither never compares equal. An absent operand is equal only
    // to the empty value, for callers that treat "empty" and "absent" alike.
    bool equals(const Comparand& other) const;

    bool operator==(const ShortId& o) const { return id_ == o.id_; }
    bool operator!=(const ShortId& o) const { return id_ != o.id_; }
    bool operator<(const ShortId& o) const { return id_ < o.id_; }

private:
    ShortId(const Uuid& id, std::string text);

    Uuid id_;
    std::string text_;
};

inline bool operator==(const ShortId& a, const Uuid& b) { return a.uuid() == b; }
inline bool operator==(const Uuid& a, const ShortId& b) { return b == a; }
inline bool operator!=(const ShortId& a, const Uuid& b) { return !(a == b); }
inline bool operator!=(const Uuid& a, const ShortId& b) { return !(b == a); }

inline bool operator==(const ShortId& a, std::nullopt_t) { return a.is_empty(); }
inline bool operator==(std::nullopt_t, const ShortId& b) { return b.is_empty(); }
inline bool operator!=(const ShortId& a, std::nullopt_t) { return !a.is_empty(); }
inline bool operator!=(std::nullopt_t, const ShortId& b) { return !b.is_empty(); }

std::ostream& operator<<(std::ostream& os, const ShortId& sid);

} // namespace shortid

namespace std {
template<>
struct hash<shortid::ShortId> {
    size_t operator()(const shortid::ShortId& s) const { return s.uuid().hash(); }
};
} // namespace std
