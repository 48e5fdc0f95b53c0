#include <shortid/short_id.hpp>
#include <shortid/base64.hpp>
#include <shortid/log.hpp>
#include <algorithm>
#include <array>
#include <ostream>

namespace shortid {

using ShortChars = std::array<char, kShortIdLength>;

static ShortChars encode_chars(const Uuid& id) {
    auto b64 = base64::encode_block(id.guid_bytes());
    ShortChars out;
    for (size_t i = 0; i < kShortIdLength; ++i) {
        out[i] = base64::to_url_safe(b64[i]);
    }
    return out;
}

// ---- Encode ----

std::string encode(const Uuid& id) {
    auto chars = encode_chars(id);
    return std::string(chars.begin(), chars.end());
}

Result<std::string> encode(std::string_view uuid_text) {
    return Uuid::from_string(uuid_text).map([](Uuid& id) { return encode(id); });
}

// ---- Decode ----

Result<Uuid> decode(std::string_view text) {
    // Reject before touching the payload; also bounds the work on long input
    if (text.size() != kShortIdLength) {
        return ShortIdError(ShortIdError::Length,
            "a short id must be exactly 22 characters long, got "
                + std::to_string(text.size()));
    }

    base64::Chars b64;
    for (size_t i = 0; i < kShortIdLength; ++i) {
        b64[i] = base64::from_url_safe(text[i]);
    }
    b64[22] = '=';
    b64[23] = '=';

    auto raw = base64::decode_block(b64);
    if (raw.is_err()) {
        return std::move(raw).error().with_input(std::string(text));
    }

    Uuid id = Uuid::from_guid_bytes(raw.value());
    auto canonical = encode_chars(id);
    if (!std::equal(canonical.begin(), canonical.end(), text.begin())) {
        return ShortIdError(ShortIdError::Format,
            "short id failed the round-trip check",
            "decodes to a uuid whose short id is '"
                + std::string(canonical.begin(), canonical.end()) + "'")
            .with_input(std::string(text));
    }
    return Result<Uuid>::ok(id);
}

bool try_decode(std::string_view text, Uuid& out) {
    auto r = decode(text);
    if (r.is_err()) {
        log::trace("try_decode rejected input: %s", r.error().message.c_str());
        out = Uuid::nil();
        return false;
    }
    out = r.value();
    return true;
}

// ---- Lenient parse ----

bool try_parse(std::string_view text, Uuid& out) {
    switch (text.size()) {
        case kShortIdLength:
            return try_decode(text, out);
        case kUuidTextLength: {
            auto r = Uuid::from_string(text);
            if (r.is_ok()) {
                out = r.value();
                return true;
            }
            log::trace("try_parse rejected uuid text: %s", r.error().message.c_str());
            break;
        }
        default:
            break;
    }
    out = Uuid::nil();
    return false;
}

bool try_parse(std::string_view text, ShortId& out) {
    Uuid id;
    if (try_parse(text, id)) {
        out = ShortId::from_uuid(id);
        return true;
    }
    out = ShortId::empty();
    return false;
}

// ---- ShortId ----

ShortId::ShortId() : text_(kEmptyText) {}

ShortId::ShortId(const Uuid& id, std::string text)
    : id_(id), text_(std::move(text)) {}

ShortId ShortId::from_uuid(const Uuid& id) {
    return ShortId(id, encode(id));
}

Result<ShortId> ShortId::from_text(std::string_view text) {
    auto id = decode(text);
    if (id.is_err()) {
        return std::move(id).error();
    }
    return Result<ShortId>::ok(ShortId(id.value(), std::string(text)));
}

Result<ShortId> ShortId::coerce(std::string_view text) {
    if (text.empty()) {
        return Result<ShortId>::ok(empty());
    }
    ShortId sid;
    if (!try_parse(text, sid)) {
        return ShortIdError(ShortIdError::Format,
            "text is neither a short id nor a uuid",
            "expected 22 base64url characters or xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx")
            .with_input(std::string(text));
    }
    return Result<ShortId>::ok(std::move(sid));
}

const ShortId& ShortId::empty() {
    static const ShortId instance;
    return instance;
}

ShortId ShortId::generate() {
    return from_uuid(Uuid::v4());
}

namespace {

struct EqualsVisitor {
    const Uuid& self;

    bool operator()(std::nullopt_t) const { return self.is_nil(); }
    bool operator()(const Uuid& u) const { return self == u; }
    bool operator()(const ShortId& s) const { return self == s.uuid(); }
    bool operator()(std::string_view text) const {
        auto r = decode(text).or_else([text](ShortIdError&) {
            return Uuid::from_string(text);
        });
        return r.is_ok() && self == r.value();
    }
};

} // namespace

bool ShortId::equals(const Comparand& other) const {
    return std::visit(EqualsVisitor{id_}, other);
}

std::ostream& operator<<(std::ostream& os, const ShortId& sid) {
    return os << sid.text();
}

} // namespace shortid
