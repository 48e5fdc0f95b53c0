#include <catch2/catch.hpp>
#include <shortid/short_id.hpp>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

using namespace shortid;

static const char* kSampleUuidText = "c9a646d3-9c61-4cb7-bfcd-ee2522c8f633";
static const char* kSampleShortText = "00amyWGct0y_ze4lIsj2Mw";

// Valid base64, but the trailing bits are not zero; canonical form ends in 'Q'
static const char* kNonCanonical = "bullshitmustnotbevalid";

// base64 of "c9a646d3-9c61-4cb7-bfcd-ee2522c8f633 and some extra chars."
static const char* kLongerBase64 =
    "YzlhNjQ2ZDMtOWM2MS00Y2I3LWJmY2QtZWUyNTIyYzhmNjMzIGFuZCBzb21lIGV4dHJhIGNoYXJzLg";

static Uuid sample_uuid() {
    return Uuid::from_string(kSampleUuidText).value();
}

// ===== Encode =====

TEST_CASE("encode produces the known short id", "[short_id]") {
    REQUIRE(encode(sample_uuid()) == kSampleShortText);
}

TEST_CASE("encode from uuid text", "[short_id]") {
    auto r = encode(std::string_view(kSampleUuidText));
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == kSampleShortText);

    auto bad = encode(std::string_view("not-a-uuid"));
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == ShortIdError::Parse);
}

TEST_CASE("encode of nil is the empty text", "[short_id]") {
    REQUIRE(encode(Uuid::nil()) == kEmptyText);
    REQUIRE(kEmptyText == "AAAAAAAAAAAAAAAAAAAAAA");
}

TEST_CASE("encode substitutes url-unsafe characters", "[short_id]") {
    auto u = Uuid::from_string("fbfffffb-ffff-ffff-ffff-ffffffffffff").value();
    REQUIRE(encode(u) == "-___-________________w");

    Uuid ones;
    ones.bytes.fill(0xFF);
    REQUIRE(encode(ones) == "_____________________w");
}

TEST_CASE("encoded ids use only the url-safe alphabet", "[short_id]") {
    for (int i = 0; i < 500; ++i) {
        auto s = encode(Uuid::v4());
        REQUIRE(s.size() == kShortIdLength);
        for (char c : s) {
            bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                      (c >= '0' && c <= '9') || c == '-' || c == '_';
            REQUIRE(ok);
        }
    }
}

// ===== Strict decode =====

TEST_CASE("decode returns the known uuid", "[short_id]") {
    auto r = decode(kSampleShortText);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sample_uuid());
    REQUIRE(r.value().to_string() == kSampleUuidText);
}

TEST_CASE("decode roundtrip random", "[short_id]") {
    for (int i = 0; i < 200; ++i) {
        auto u = Uuid::v4();
        auto r = decode(encode(u));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == u);
    }
}

TEST_CASE("decode rejects wrong length", "[short_id]") {
    std::string longer = std::string(kSampleShortText) + "A";
    auto r = decode(longer);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortIdError::Length);

    REQUIRE(decode("").error().code == ShortIdError::Length);
    REQUIRE(decode("Am I valid?").error().code == ShortIdError::Length);
    REQUIRE(decode(kLongerBase64).error().code == ShortIdError::Length);
    REQUIRE(decode(kSampleUuidText).error().code == ShortIdError::Length);
}

TEST_CASE("decode rejects characters outside the alphabet", "[short_id]") {
    auto r = decode("I am 22characters long");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortIdError::Format);
    REQUIRE(r.error().input == "I am 22characters long");
}

TEST_CASE("decode rejects non-canonical text", "[short_id]") {
    auto r = decode(kNonCanonical);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortIdError::Format);
    REQUIRE(r.error().hint.find("bullshitmustnotbevaliQ") != std::string::npos);

    REQUIRE(decode("bullshitmustnotbevaliQ").is_ok());
    REQUIRE(decode("AAAAAAAAAAAAAAAAAAAAAB").error().code == ShortIdError::Format);
}

TEST_CASE("decode rejects standard base64 characters", "[short_id]") {
    // '+' and '/' decode to valid bytes but never re-encode to themselves
    auto r = decode("+___+________________w");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortIdError::Format);
    REQUIRE(decode("-___-________________w").is_ok());
}

TEST_CASE("try_decode reports failure without error", "[short_id]") {
    Uuid out = Uuid::v4();
    REQUIRE_FALSE(try_decode(kNonCanonical, out));
    REQUIRE(out.is_nil());

    out = Uuid::v4();
    REQUIRE_FALSE(try_decode("short", out));
    REQUIRE(out.is_nil());

    REQUIRE(try_decode(kSampleShortText, out));
    REQUIRE(out == sample_uuid());
}

// ===== Lenient parse =====

TEST_CASE("try_parse accepts both forms as uuid", "[short_id]") {
    Uuid a, b;
    REQUIRE(try_parse(kSampleShortText, a));
    REQUIRE(try_parse(kSampleUuidText, b));
    REQUIRE(a == sample_uuid());
    REQUIRE(b == sample_uuid());
}

TEST_CASE("try_parse accepts both forms as ShortId", "[short_id]") {
    ShortId a, b;
    REQUIRE(try_parse(kSampleShortText, a));
    REQUIRE(try_parse(kSampleUuidText, b));
    REQUIRE(a.text() == kSampleShortText);
    REQUIRE(b.text() == kSampleShortText);
    REQUIRE(a.uuid() == sample_uuid());
    REQUIRE(b.uuid() == sample_uuid());
}

TEST_CASE("try_parse of the nil uuid literal succeeds", "[short_id]") {
    ShortId out = ShortId::generate();
    REQUIRE(try_parse("00000000-0000-0000-0000-000000000000", out));
    REQUIRE(out.is_empty());
    REQUIRE(out.text() == kEmptyText);
}

TEST_CASE("try_parse failures leave the empty value", "[short_id]") {
    ShortId sid = ShortId::generate();
    REQUIRE_FALSE(try_parse("", sid));
    REQUIRE(sid.is_empty());

    sid = ShortId::generate();
    REQUIRE_FALSE(try_parse("Nothing to see here...", sid));
    REQUIRE(sid.is_empty());

    sid = ShortId::generate();
    REQUIRE_FALSE(try_parse(kNonCanonical, sid));
    REQUIRE(sid.is_empty());

    Uuid u = Uuid::v4();
    REQUIRE_FALSE(try_parse("c9a646d3x9c61-4cb7-bfcd-ee2522c8f633", u));
    REQUIRE(u.is_nil());

    u = Uuid::v4();
    REQUIRE_FALSE(try_parse(kLongerBase64, u));
    REQUIRE(u.is_nil());
}

TEST_CASE("try_parse rejects uuid text with misplaced dashes", "[short_id]") {
    const char* malformed = "c9a646d3-9c61-4cb7-bfcd--ee2522c8f6-";

    Uuid u = Uuid::v4();
    REQUIRE_FALSE(try_parse(malformed, u));
    REQUIRE(u.is_nil());

    ShortId sid = ShortId::generate();
    REQUIRE_FALSE(try_parse(malformed, sid));
    REQUIRE(sid.is_empty());

    auto coerced = ShortId::coerce(malformed);
    REQUIRE(coerced.is_err());
    REQUIRE(coerced.error().code == ShortIdError::Format);

    auto near = ShortId::from_uuid(
        Uuid::from_string("c9a646d3-9c61-4cb7-bfcd-ee2522c8f600").value());
    REQUIRE_FALSE(near.equals(malformed));
}

// ===== ShortId =====

TEST_CASE("ShortId from_text decodes", "[short_id]") {
    auto r = ShortId::from_text(kSampleShortText);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().text() == kSampleShortText);
    REQUIRE(r.value().uuid() == sample_uuid());
}

TEST_CASE("ShortId from_text propagates decode errors", "[short_id]") {
    auto r = ShortId::from_text(kNonCanonical);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == ShortIdError::Format);

    // the 36-char form is not a short id
    auto u = ShortId::from_text(kSampleUuidText);
    REQUIRE(u.is_err());
    REQUIRE(u.error().code == ShortIdError::Length);
}

TEST_CASE("ShortId from_uuid caches the encoding", "[short_id]") {
    auto sid = ShortId::from_uuid(sample_uuid());
    REQUIRE(sid.text() == kSampleShortText);
    REQUIRE(sid.uuid() == sample_uuid());
}

TEST_CASE("ShortId empty value", "[short_id]") {
    const ShortId& e = ShortId::empty();
    REQUIRE(e.is_empty());
    REQUIRE(e.uuid() == Uuid::nil());
    REQUIRE(e.text() == kEmptyText);
    REQUIRE(encode(e.uuid()) == e.text());
    REQUIRE(ShortId() == e);
    REQUIRE(ShortId::from_uuid(Uuid::nil()) == e);
    REQUIRE(ShortId::from_uuid(Uuid::nil()).text() == e.text());
}

TEST_CASE("ShortId generate yields distinct v4 ids", "[short_id]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto sid = ShortId::generate();
        REQUIRE((sid.uuid().bytes[6] & 0xF0) == 0x40);
        REQUIRE(encode(sid.uuid()) == sid.text());
        REQUIRE(seen.insert(sid.text()).second);
    }
}

TEST_CASE("ShortId coerce", "[short_id]") {
    auto empty = ShortId::coerce("");
    REQUIRE(empty.is_ok());
    REQUIRE(empty.value().is_empty());

    REQUIRE(ShortId::coerce(kSampleShortText).value().uuid() == sample_uuid());
    REQUIRE(ShortId::coerce(kSampleUuidText).value().text() == kSampleShortText);

    auto bad = ShortId::coerce("Nothing to see here...");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == ShortIdError::Format);
}

TEST_CASE("ShortId equals", "[short_id]") {
    auto sid = ShortId::from_text(kSampleShortText).value();

    REQUIRE(sid.equals(sid));
    REQUIRE(sid.equals(sample_uuid()));
    REQUIRE(sid.equals(kSampleUuidText));
    REQUIRE(sid.equals(kSampleShortText));
    REQUIRE(sid.equals(std::string(kSampleShortText)));

    REQUIRE_FALSE(sid.equals(Uuid::v4()));
    REQUIRE_FALSE(sid.equals(ShortId::generate()));
    REQUIRE_FALSE(sid.equals("Nothing to see here..."));
    REQUIRE_FALSE(sid.equals(kNonCanonical));
    REQUIRE_FALSE(sid.equals(std::nullopt));
}

TEST_CASE("Empty ShortId equals an absent value", "[short_id]") {
    REQUIRE(ShortId::empty().equals(std::nullopt));
    REQUIRE(ShortId::empty() == std::nullopt);
    REQUIRE(std::nullopt == ShortId::empty());

    auto sid = ShortId::generate();
    REQUIRE(sid != std::nullopt);
    REQUIRE_FALSE(std::nullopt == sid);
}

TEST_CASE("ShortId and Uuid equality is symmetric", "[short_id]") {
    auto u = sample_uuid();
    auto sid = ShortId::from_uuid(u);
    REQUIRE(sid == u);
    REQUIRE(u == sid);

    auto other = Uuid::v4();
    REQUIRE(sid != other);
    REQUIRE(other != sid);

    REQUIRE(ShortId::empty() == Uuid::nil());
    REQUIRE(Uuid::nil() == ShortId::empty());
}

TEST_CASE("ShortId ordering follows the uuid", "[short_id]") {
    auto a = Uuid::from_string("00000000-0000-0000-0000-000000000001").value();
    auto b = Uuid::from_string("10000000-0000-0000-0000-000000000000").value();
    REQUIRE(ShortId::from_uuid(a) < ShortId::from_uuid(b));
    REQUIRE_FALSE(ShortId::from_uuid(b) < ShortId::from_uuid(a));
}

TEST_CASE("ShortId hash matches the uuid hash", "[short_id]") {
    auto u = Uuid::v4();
    auto sid = ShortId::from_uuid(u);
    REQUIRE(std::hash<ShortId>{}(sid) == std::hash<Uuid>{}(u));

    std::unordered_set<ShortId> ids;
    ids.insert(sid);
    ids.insert(ShortId::from_text(sid.text()).value());
    REQUIRE(ids.size() == 1);

    std::unordered_map<Uuid, int> by_uuid;
    by_uuid[u] = 7;
    REQUIRE(by_uuid.at(sid.uuid()) == 7);
}

TEST_CASE("ShortId stream output is the short text", "[short_id]") {
    std::ostringstream os;
    os << ShortId::from_uuid(sample_uuid());
    REQUIRE(os.str() == kSampleShortText);
}
