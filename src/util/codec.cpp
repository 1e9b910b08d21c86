#include <yyid/codec.hpp>
#include <cctype>
#include <stdexcept>

namespace yyid {

static const char lower_hex[] = "0123456789abcdef";
static const char upper_hex[] = "0123456789ABCDEF";

// Byte offsets that start each 8-4-4-4-12 group, plus the end.
static constexpr size_t group_bounds[] = {0, 4, 6, 8, 10, 16};

namespace detail {

void encode_hex(const YyidBytes& src, char* dst, bool upper, bool hyphens) {
    const char* lut = upper ? upper_hex : lower_hex;
    size_t out = 0;
    for (size_t group = 0; group < 5; ++group) {
        if (hyphens && group > 0) {
            dst[out++] = '-';
        }
        for (size_t i = group_bounds[group]; i < group_bounds[group + 1]; ++i) {
            dst[out++] = lut[src[i] >> 4];
            dst[out++] = lut[src[i] & 0x0F];
        }
    }
}

void encode_into(const YyidBytes& src, Format fmt, bool upper, char* dst) {
    switch (fmt) {
        case Format::Simple:
            encode_hex(src, dst, upper, false);
            break;
        case Format::Hyphenated:
            encode_hex(src, dst, upper, true);
            break;
        case Format::Braced:
            dst[0] = '{';
            encode_hex(src, dst + 1, upper, true);
            dst[37] = '}';
            break;
        case Format::Urn:
            URN_PREFIX.copy(dst, URN_PREFIX.size());
            encode_hex(src, dst + URN_PREFIX.size(), upper, true);
            break;
    }
}

void throw_buffer_too_small(Format fmt, size_t got) {
    throw std::out_of_range(std::string("buffer too small for ") + format_name(fmt) +
        " encoding: need " + std::to_string(format_length(fmt)) +
        " bytes, got " + std::to_string(got));
}

} // namespace detail

// ---- Format names ----

const char* format_name(Format fmt) {
    switch (fmt) {
        case Format::Simple:     return "simple";
        case Format::Hyphenated: return "hyphenated";
        case Format::Braced:     return "braced";
        case Format::Urn:        return "urn";
    }
    return "unknown";
}

static std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

Result<Format> parse_format(const std::string& name) {
    auto n = to_lower(name);
    if (n == "simple") return Result<Format>::ok(Format::Simple);
    if (n == "hyphenated") return Result<Format>::ok(Format::Hyphenated);
    if (n == "braced") return Result<Format>::ok(Format::Braced);
    if (n == "urn") return Result<Format>::ok(Format::Urn);
    return YyidError{YyidError::InvalidArg,
        "unknown format: '" + name + "'",
        "expected one of: simple, hyphenated, braced, urn"};
}

Result<Case> parse_case(const std::string& name) {
    auto n = to_lower(name);
    if (n == "lower") return Result<Case>::ok(Case::Lower);
    if (n == "upper") return Result<Case>::ok(Case::Upper);
    return YyidError{YyidError::InvalidArg,
        "unknown case: '" + name + "'",
        "expected 'lower' or 'upper'"};
}

// ---- String helpers ----

std::string encode(const Yyid& id, Format fmt, Case c) {
    std::string out(format_length(fmt), '\0');
    detail::encode_into(id.as_bytes(), fmt, c == Case::Upper, &out[0]);
    return out;
}

std::string to_string(const Yyid& id) {
    return Hyphenated(id).to_string();
}

std::string yyid_string() {
    return to_string(Yyid::random());
}

std::ostream& operator<<(std::ostream& os, const Yyid& id) {
    return os << Hyphenated(id);
}

} // namespace yyid
