#include <yyid/uuid.hpp>
#include <yyid/codec.hpp>
#include <yyid/parse.hpp>

namespace yyid {

// ---- UUID v4 ----

Result<Uuid> Uuid::v4(EntropySource& source) {
    Uuid u;
    YYID_TRY(source.fill(u.bytes.data(), u.bytes.size()));
    // Set version 4: bytes[6] high nibble = 0100
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    // Set variant 1: bytes[8] top two bits = 10
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return Result<Uuid>::ok(u);
}

// ---- Text ----

std::string Uuid::to_string() const {
    return Hyphenated(from_uuid(*this)).to_string();
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    return parse_as(Format::Hyphenated, s).and_then(to_uuid);
}

// ---- Inspection ----

bool Uuid::is_nil() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

int Uuid::version() const {
    return bytes[6] >> 4;
}

bool Uuid::is_rfc4122_variant() const {
    return (bytes[8] & 0xC0) == 0x80;
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

// ---- Conversions ----

Yyid from_uuid(const Uuid& uuid) {
    return Yyid::from_bytes(uuid.bytes);
}

Result<Uuid> to_uuid(const Yyid& id) {
    Uuid u;
    u.bytes = id.as_bytes();
    if (u.is_nil()) {
        return Result<Uuid>::ok(u);
    }
    if (!u.is_rfc4122_variant()) {
        return YyidError{YyidError::Conversion,
            "YYID " + to_string(id) + " does not carry the RFC 4122 variant",
            "byte 8 must have its top two bits set to 10"};
    }
    int v = u.version();
    if (v < 1 || v > 8) {
        return YyidError{YyidError::Conversion,
            "YYID " + to_string(id) + " has no valid UUID version (nibble " +
            std::to_string(v) + ")",
            "byte 6 high nibble must be between 1 and 8"};
    }
    return Result<Uuid>::ok(u);
}

} // namespace yyid
