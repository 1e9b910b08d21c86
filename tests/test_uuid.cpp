#include <catch2/catch.hpp>
#include <yyid/codec.hpp>
#include <yyid/uuid.hpp>
#include "fake_entropy.hpp"
#include <set>

using namespace yyid;

TEST_CASE("Uuid and Yyid share size and alignment", "[uuid]") {
    REQUIRE(sizeof(Uuid) == sizeof(Yyid));
    REQUIRE(alignof(Uuid) == alignof(Yyid));
}

TEST_CASE("UUID v4 version and variant bits", "[uuid]") {
    auto u = Uuid::v4(system_entropy());
    REQUIRE(u.is_ok());
    REQUIRE((u.value().bytes[6] & 0xF0) == 0x40);
    REQUIRE((u.value().bytes[8] & 0xC0) == 0x80);
    REQUIRE(u.value().version() == 4);
    REQUIRE(u.value().is_rfc4122_variant());
}

TEST_CASE("UUID v4 stamps bits over scripted bytes", "[uuid]") {
    ScriptedEntropy src({0xFF});
    auto u = Uuid::v4(src);
    REQUIRE(u.is_ok());
    REQUIRE(u.value().bytes[6] == 0x4F);
    REQUIRE(u.value().bytes[8] == 0xBF);
}

TEST_CASE("UUID v4 propagates entropy failure", "[uuid]") {
    FailingEntropy src;
    auto u = Uuid::v4(src);
    REQUIRE(u.is_err());
    REQUIRE(u.error().code == YyidError::Entropy);
}

TEST_CASE("UUID v4 generates unique values", "[uuid]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto s = Uuid::v4(system_entropy()).value().to_string();
        REQUIRE(seen.find(s) == seen.end());
        seen.insert(s);
    }
}

TEST_CASE("UUID to_string matches the YYID text", "[uuid]") {
    auto u = Uuid::v4(system_entropy()).value();
    auto s = u.to_string();
    REQUIRE(s.size() == 36);
    REQUIRE(s[14] == '4');
    REQUIRE(s == hyphenated(from_uuid(u)).to_string());
}

TEST_CASE("UUID from_string roundtrip", "[uuid]") {
    auto u = Uuid::v4(system_entropy()).value();
    auto parsed = Uuid::from_string(u.to_string());
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value() == u);
}

TEST_CASE("UUID from_string rejects non-hyphenated text", "[uuid]") {
    auto r = Uuid::from_string("550e8400e29b41d4a716446655440000");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == YyidError::Parse);
}

TEST_CASE("UUID from_string rejects a bare YYID", "[uuid]") {
    // Variant bits of byte 8 (0x12) are 00
    auto r = Uuid::from_string("02e7f0f6-067e-8c92-125c-12c9180540a9");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == YyidError::Conversion);
}

TEST_CASE("from_uuid keeps bytes", "[uuid]") {
    auto u = Uuid::v4(system_entropy()).value();
    auto id = from_uuid(u);
    REQUIRE(id.as_bytes() == u.bytes);
}

TEST_CASE("to_uuid accepts valid UUID bytes", "[uuid]") {
    auto u = Uuid::v4(system_entropy()).value();
    auto back = to_uuid(from_uuid(u));
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == u);
}

TEST_CASE("to_uuid accepts nil", "[uuid]") {
    auto r = to_uuid(Yyid::nil());
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_nil());
}

TEST_CASE("to_uuid rejects wrong variant", "[uuid]") {
    YyidBytes b{};
    b[0] = 0x01;
    b[6] = 0x40;
    b[8] = 0xC0;  // 11xxxxxx is the reserved Microsoft variant
    auto r = to_uuid(Yyid::from_bytes(b));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == YyidError::Conversion);
}

TEST_CASE("to_uuid rejects version out of range", "[uuid]") {
    YyidBytes b{};
    b[6] = 0x00;
    b[8] = 0x80;
    REQUIRE(to_uuid(Yyid::from_bytes(b)).is_err());
    b[6] = 0xF0;
    REQUIRE(to_uuid(Yyid::from_bytes(b)).is_err());
    b[6] = 0x70;
    REQUIRE(to_uuid(Yyid::from_bytes(b)).is_ok());
}

TEST_CASE("UUID equality operators", "[uuid]") {
    auto a = Uuid::v4(system_entropy()).value();
    auto b = a; // copy
    REQUIRE(a == b);
    REQUIRE_FALSE(a != b);

    auto c = Uuid::v4(system_entropy()).value();
    REQUIRE(a != c);
    REQUIRE_FALSE(a == c);
}
