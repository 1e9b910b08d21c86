#include <catch2/catch.hpp>
#include <yyid/codec.hpp>
#include <array>
#include <cctype>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

using namespace yyid;

static const Yyid sample = Yyid::from_bytes({
    0x02, 0xe7, 0xf0, 0xf6, 0x06, 0x7e, 0x8c, 0x92,
    0xb2, 0x5c, 0x12, 0xc9, 0x18, 0x05, 0x40, 0xa9
});

static_assert(Simple::LENGTH == 32, "simple length");
static_assert(Hyphenated::LENGTH == 36, "hyphenated length");
static_assert(Braced::LENGTH == 38, "braced length");
static_assert(Urn::LENGTH == 45, "urn length");

static_assert(sizeof(Hyphenated) == sizeof(Yyid), "view adds no state");
static_assert(sizeof(Braced) == sizeof(Yyid), "view adds no state");

static const std::regex hyphen_re(
    "[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}");

// ===== Known value =====

TEST_CASE("encodes known bytes in every form", "[codec]") {
    REQUIRE(simple(sample).to_string() == "02e7f0f6067e8c92b25c12c9180540a9");
    REQUIRE(hyphenated(sample).to_string() == "02e7f0f6-067e-8c92-b25c-12c9180540a9");
    REQUIRE(braced(sample).to_string() == "{02e7f0f6-067e-8c92-b25c-12c9180540a9}");
    REQUIRE(urn(sample).to_string() == "urn:yyid:02e7f0f6-067e-8c92-b25c-12c9180540a9");
}

TEST_CASE("upper case uses upper hex digits only", "[codec]") {
    REQUIRE(simple(sample).to_upper_string() == "02E7F0F6067E8C92B25C12C9180540A9");
    REQUIRE(hyphenated(sample).to_upper_string() == "02E7F0F6-067E-8C92-B25C-12C9180540A9");
    REQUIRE(braced(sample).to_upper_string() == "{02E7F0F6-067E-8C92-B25C-12C9180540A9}");
    // Prefix stays lower case
    REQUIRE(urn(sample).to_upper_string() == "urn:yyid:02E7F0F6-067E-8C92-B25C-12C9180540A9");
}

TEST_CASE("nil encodes as zeros", "[codec]") {
    auto n = Yyid::nil();
    REQUIRE(hyphenated(n).to_string() == "00000000-0000-0000-0000-000000000000");
    REQUIRE(simple(n).to_string() == std::string(32, '0'));
    REQUIRE(to_string(n) == "00000000-0000-0000-0000-000000000000");
}

TEST_CASE("all-0xFF encodes as f", "[codec]") {
    YyidBytes ff;
    ff.fill(0xFF);
    REQUIRE(simple(Yyid::from_bytes(ff)).to_string() == std::string(32, 'f'));
    REQUIRE(simple(Yyid::from_bytes(ff)).to_upper_string() == std::string(32, 'F'));
}

// ===== Invariants over random identifiers =====

TEST_CASE("lengths are fixed per form", "[codec]") {
    for (int i = 0; i < 100; ++i) {
        auto id = Yyid::random();
        REQUIRE(simple(id).to_string().size() == 32);
        REQUIRE(hyphenated(id).to_string().size() == 36);
        REQUIRE(braced(id).to_string().size() == 38);
        REQUIRE(urn(id).to_string().size() == 45);
    }
}

TEST_CASE("charset of each form", "[codec]") {
    for (int i = 0; i < 100; ++i) {
        auto id = Yyid::random();
        auto s = simple(id).to_string();
        for (char c : s) {
            REQUIRE(((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')));
        }

        auto h = hyphenated(id).to_string();
        REQUIRE(std::regex_match(h, hyphen_re));
        REQUIRE(braced(id).to_string() == "{" + h + "}");
        REQUIRE(urn(id).to_string() == "urn:yyid:" + h);
    }
}

TEST_CASE("hyphenated without dashes equals simple", "[codec]") {
    for (int i = 0; i < 100; ++i) {
        auto id = Yyid::random();
        std::string stripped;
        for (char c : hyphenated(id).to_string()) {
            if (c != '-') stripped += c;
        }
        REQUIRE(stripped == simple(id).to_string());
    }
}

TEST_CASE("upper and lower differ only in case", "[codec]") {
    auto id = Yyid::random();
    auto lower = braced(id).to_string();
    auto upper = braced(id).to_upper_string();
    REQUIRE(lower.size() == upper.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        REQUIRE(std::toupper(static_cast<unsigned char>(lower[i])) == upper[i]);
    }
}

// ===== Caller buffers =====

TEST_CASE("encode_lower writes into caller buffer", "[codec]") {
    std::array<char, 64> buf;
    buf.fill('#');
    auto sv = hyphenated(sample).encode_lower(buf);
    REQUIRE(sv == "02e7f0f6-067e-8c92-b25c-12c9180540a9");
    REQUIRE(sv.data() == buf.data());
    // Bytes past LENGTH are untouched
    REQUIRE(buf[36] == '#');
}

TEST_CASE("encode_upper with exact-size raw buffer", "[codec]") {
    char buf[Urn::LENGTH];
    auto sv = urn(sample).encode_upper(buf, sizeof(buf));
    REQUIRE(sv.size() == Urn::LENGTH);
    REQUIRE(sv == "urn:yyid:02E7F0F6-067E-8C92-B25C-12C9180540A9");
}

TEST_CASE("buffer shorter than LENGTH throws", "[codec]") {
    std::array<char, 35> short_buf;
    REQUIRE_THROWS_AS(hyphenated(sample).encode_lower(short_buf), std::out_of_range);
    REQUIRE_THROWS_AS(braced(sample).encode_upper(short_buf), std::out_of_range);

    char tiny[4];
    REQUIRE_THROWS_AS(simple(sample).encode_lower(tiny, sizeof(tiny)), std::out_of_range);
    REQUIRE_THROWS_AS(urn(sample).encode_lower(nullptr, 100), std::out_of_range);
}

TEST_CASE("buffer-too-small message names the form", "[codec]") {
    std::array<char, 10> buf;
    try {
        urn(sample).encode_lower(buf);
        FAIL("expected std::out_of_range");
    } catch (const std::out_of_range& e) {
        std::string what = e.what();
        REQUIRE(what.find("urn") != std::string::npos);
        REQUIRE(what.find("45") != std::string::npos);
    }
}

// ===== Views =====

TEST_CASE("views unwrap losslessly", "[codec]") {
    auto id = Yyid::random();
    REQUIRE(simple(id).as_yyid() == id);
    REQUIRE(hyphenated(id).into_yyid() == id);
    REQUIRE(Braced(id).into_yyid() == id);
    REQUIRE(Urn(id).as_yyid() == id);
}

TEST_CASE("several views coexist over one identifier", "[codec]") {
    auto s = simple(sample);
    auto h = hyphenated(sample);
    auto b = braced(sample);
    REQUIRE(s.as_yyid() == h.as_yyid());
    REQUIRE(h.as_yyid() == b.as_yyid());
}

TEST_CASE("default view wraps nil", "[codec]") {
    Simple s;
    REQUIRE(s.as_yyid().is_nil());
    REQUIRE(s.to_string() == std::string(32, '0'));
}

TEST_CASE("views compare and hash like the identifier", "[codec]") {
    auto a = Yyid::random();
    auto b = Yyid::random();
    REQUIRE(urn(a) == urn(a));
    REQUIRE(urn(a) != urn(b));
    REQUIRE((simple(a) < simple(b)) == (a < b));

    std::unordered_set<Hyphenated> set;
    set.insert(hyphenated(a));
    REQUIRE(set.count(hyphenated(a)) == 1);
    REQUIRE(set.count(hyphenated(b)) == 0);
    REQUIRE(std::hash<Hyphenated>{}(hyphenated(a)) == std::hash<Yyid>{}(a));
}

// ===== Stream output and helpers =====

TEST_CASE("stream output is lower case", "[codec]") {
    std::ostringstream os;
    os << sample << " " << simple(sample) << " " << urn(sample);
    REQUIRE(os.str() ==
        "02e7f0f6-067e-8c92-b25c-12c9180540a9 "
        "02e7f0f6067e8c92b25c12c9180540a9 "
        "urn:yyid:02e7f0f6-067e-8c92-b25c-12c9180540a9");
}

TEST_CASE("encode() matches the view types", "[codec]") {
    auto id = Yyid::random();
    REQUIRE(encode(id, Format::Simple) == simple(id).to_string());
    REQUIRE(encode(id, Format::Hyphenated, Case::Upper) == hyphenated(id).to_upper_string());
    REQUIRE(encode(id, Format::Braced) == braced(id).to_string());
    REQUIRE(encode(id, Format::Urn, Case::Upper) == urn(id).to_upper_string());
}

TEST_CASE("yyid_string is a fresh hyphenated identifier", "[codec]") {
    auto a = yyid_string();
    auto b = yyid_string();
    REQUIRE(std::regex_match(a, hyphen_re));
    REQUIRE(a != b);
}

TEST_CASE("format names round-trip", "[codec]") {
    for (Format f : {Format::Simple, Format::Hyphenated, Format::Braced, Format::Urn}) {
        auto r = parse_format(format_name(f));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == f);
    }
    REQUIRE(parse_format("URN").value() == Format::Urn);
    REQUIRE(parse_format("dashed").is_err());
    REQUIRE(parse_format("dashed").error().code == YyidError::InvalidArg);
}

TEST_CASE("parse_case", "[codec]") {
    REQUIRE(parse_case("lower").value() == Case::Lower);
    REQUIRE(parse_case("Upper").value() == Case::Upper);
    REQUIRE(parse_case("title").is_err());
}
