#pragma once

#include <yyid/result.hpp>
#include <yyid/yyid.hpp>
#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace yyid {

enum class Format { Simple, Hyphenated, Braced, Urn };
enum class Case { Lower, Upper };

constexpr size_t format_length(Format fmt) {
    switch (fmt) {
        case Format::Simple:     return 32;
        case Format::Hyphenated: return 36;
        case Format::Braced:     return 38;
        case Format::Urn:        return 45;
    }
    return 0;
}

inline constexpr std::string_view URN_PREFIX = "urn:yyid:";

const char* format_name(Format fmt);
Result<Format> parse_format(const std::string& name);
Result<Case> parse_case(const std::string& name);

namespace detail {

// Shared hex-group encoder. Writes 32 hex digits, or 36 characters in
// 8-4-4-4-12 groups when hyphens is set, starting at dst.
void encode_hex(const YyidBytes& src, char* dst, bool upper, bool hyphens);

// Writes the complete encoding; dst must hold format_length(fmt) chars.
void encode_into(const YyidBytes& src, Format fmt, bool upper, char* dst);

[[noreturn]] void throw_buffer_too_small(Format fmt, size_t got);

} // namespace detail

// An identifier tagged with the text encoding it should be rendered in.
// Carries nothing but the identifier, so unwrapping is lossless.
template<Format F>
class Encoded {
public:
    static constexpr Format FORMAT = F;
    static constexpr size_t LENGTH = format_length(F);

    constexpr Encoded() = default;
    constexpr explicit Encoded(const Yyid& id) : id_(id) {}

    constexpr const Yyid& as_yyid() const { return id_; }
    constexpr Yyid into_yyid() const { return id_; }

    // Writes the encoding to the front of buf and returns a view of the
    // LENGTH written characters. Throws std::out_of_range if len < LENGTH.
    std::string_view encode_lower(char* buf, size_t len) const { return encode(buf, len, false); }
    std::string_view encode_upper(char* buf, size_t len) const { return encode(buf, len, true); }

    template<size_t N>
    std::string_view encode_lower(std::array<char, N>& buf) const { return encode(buf.data(), N, false); }
    template<size_t N>
    std::string_view encode_upper(std::array<char, N>& buf) const { return encode(buf.data(), N, true); }

    std::string to_string() const { return render(false); }
    std::string to_upper_string() const { return render(true); }

    bool operator==(const Encoded& o) const { return id_ == o.id_; }
    bool operator!=(const Encoded& o) const { return id_ != o.id_; }
    bool operator<(const Encoded& o) const { return id_ < o.id_; }

private:
    std::string_view encode(char* buf, size_t len, bool upper) const {
        if (buf == nullptr || len < LENGTH) {
            detail::throw_buffer_too_small(F, buf == nullptr ? 0 : len);
        }
        detail::encode_into(id_.as_bytes(), F, upper, buf);
        return std::string_view(buf, LENGTH);
    }

    std::string render(bool upper) const {
        std::array<char, LENGTH> buf;
        return std::string(encode(buf.data(), buf.size(), upper));
    }

    Yyid id_;
};

// 2ff0b694960e88a4693a66cff98fc56c
using Simple = Encoded<Format::Simple>;
// 02e7f0f6-067e-8c92-b25c-12c9180540a9
using Hyphenated = Encoded<Format::Hyphenated>;
// {02e7f0f6-067e-8c92-b25c-12c9180540a9}
using Braced = Encoded<Format::Braced>;
// urn:yyid:02e7f0f6-067e-8c92-b25c-12c9180540a9
using Urn = Encoded<Format::Urn>;

static_assert(sizeof(Simple) == sizeof(Yyid) && alignof(Simple) == alignof(Yyid),
    "encoded views must share the identifier's layout");
static_assert(sizeof(Urn) == sizeof(Yyid) && alignof(Urn) == alignof(Yyid),
    "encoded views must share the identifier's layout");

inline Simple simple(const Yyid& id) { return Simple(id); }
inline Hyphenated hyphenated(const Yyid& id) { return Hyphenated(id); }
inline Braced braced(const Yyid& id) { return Braced(id); }
inline Urn urn(const Yyid& id) { return Urn(id); }

std::string encode(const Yyid& id, Format fmt, Case c = Case::Lower);

// Hyphenated lower case, the canonical text of an identifier.
std::string to_string(const Yyid& id);

// A fresh random identifier as hyphenated lower-case text.
std::string yyid_string();

std::ostream& operator<<(std::ostream& os, const Yyid& id);

template<Format F>
std::ostream& operator<<(std::ostream& os, const Encoded<F>& e) {
    std::array<char, Encoded<F>::LENGTH> buf;
    return os << e.encode_lower(buf);
}

} // namespace yyid

namespace std {
template<yyid::Format F>
struct hash<yyid::Encoded<F>> {
    size_t operator()(const yyid::Encoded<F>& e) const noexcept {
        return yyid::hash_bytes(e.as_yyid().as_bytes());
    }
};
} // namespace std
