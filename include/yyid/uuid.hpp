#pragma once

#include <yyid/entropy.hpp>
#include <yyid/result.hpp>
#include <yyid/yyid.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace yyid {

// RFC 4122 UUID. Every Uuid is a valid Yyid, but only some Yyids are
// valid Uuids: the version nibble and variant bits are reserved here.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    // Random bytes with version 4 and the RFC 4122 variant stamped in
    static Result<Uuid> v4(EntropySource& source);

    // Hyphenated form only, either case
    static Result<Uuid> from_string(const std::string& s);
    std::string to_string() const;

    bool is_nil() const;
    // High nibble of byte 6
    int version() const;
    // Top two bits of byte 8 are 10
    bool is_rfc4122_variant() const;

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
};

static_assert(sizeof(Uuid) == sizeof(Yyid) && alignof(Uuid) == alignof(Yyid),
    "Uuid and Yyid must share a layout");

// Lossless: any 128-bit pattern is a Yyid.
Yyid from_uuid(const Uuid& uuid);

// Fails with YyidError::Conversion unless the identifier is nil or carries
// the RFC 4122 variant and a version between 1 and 8.
Result<Uuid> to_uuid(const Yyid& id);

} // namespace yyid
