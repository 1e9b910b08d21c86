#include <yyid/parse.hpp>
#include <string>

namespace yyid {

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static const char* expected_shape(Format fmt) {
    switch (fmt) {
        case Format::Simple:     return "expected 32 hex digits";
        case Format::Hyphenated: return "expected xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx";
        case Format::Braced:     return "expected {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}";
        case Format::Urn:        return "expected urn:yyid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx";
    }
    return "";
}

// Decode 32 hex digits, with hyphens at 8, 13, 18, 23 when hyphenated.
// offset is where body starts within the full input, for error positions.
static Result<Yyid> decode_body(std::string_view body, bool hyphenated,
                                size_t offset, Format fmt) {
    YyidBytes bytes{};
    size_t byte_idx = 0;
    for (size_t i = 0; i < body.size(); ) {
        if (hyphenated && (i == 8 || i == 13 || i == 18 || i == 23)) {
            if (body[i] != '-') {
                return YyidError{YyidError::Parse,
                    "expected '-' at position " + std::to_string(offset + i),
                    expected_shape(fmt)};
            }
            ++i;
            continue;
        }
        int hi = hex_val(body[i]);
        int lo = hex_val(body[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return YyidError{YyidError::Parse,
                std::string("invalid hex character '") + body[bad] +
                "' at position " + std::to_string(offset + bad),
                expected_shape(fmt)};
        }
        bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Yyid>::ok(Yyid::from_bytes(bytes));
}

Result<Yyid> parse_as(Format fmt, std::string_view text) {
    if (text.size() != format_length(fmt)) {
        return YyidError{YyidError::Parse,
            std::string(format_name(fmt)) + " YYID must be " +
            std::to_string(format_length(fmt)) + " characters, got " +
            std::to_string(text.size()),
            expected_shape(fmt)};
    }

    switch (fmt) {
        case Format::Simple:
            return decode_body(text, false, 0, fmt);
        case Format::Hyphenated:
            return decode_body(text, true, 0, fmt);
        case Format::Braced:
            if (text.front() != '{' || text.back() != '}') {
                return YyidError{YyidError::Parse,
                    "braced YYID must be wrapped in '{' and '}'",
                    expected_shape(fmt)};
            }
            return decode_body(text.substr(1, 36), true, 1, fmt);
        case Format::Urn:
            if (text.substr(0, URN_PREFIX.size()) != URN_PREFIX) {
                return YyidError{YyidError::Parse,
                    "URN YYID must start with 'urn:yyid:'",
                    expected_shape(fmt)};
            }
            return decode_body(text.substr(URN_PREFIX.size()), true, URN_PREFIX.size(), fmt);
    }
    return YyidError{YyidError::InvalidArg, "unknown format"};
}

Result<Yyid> parse_yyid(std::string_view text) {
    for (Format fmt : {Format::Simple, Format::Hyphenated, Format::Braced, Format::Urn}) {
        if (text.size() == format_length(fmt)) {
            return parse_as(fmt, text);
        }
    }
    return YyidError{YyidError::Parse,
        "YYID text must be 32, 36, 38 or 45 characters, got " + std::to_string(text.size()),
        "accepted forms: simple, hyphenated, braced, urn"};
}

} // namespace yyid
