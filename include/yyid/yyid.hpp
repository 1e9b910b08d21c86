#pragma once

#include <yyid/entropy.hpp>
#include <yyid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace yyid {

using YyidBytes = std::array<uint8_t, 16>;

// 128-bit integer split into two 64-bit halves.
struct Uint128 {
    uint64_t high = 0;
    uint64_t low = 0;

    constexpr bool operator==(const Uint128& o) const { return high == o.high && low == o.low; }
    constexpr bool operator!=(const Uint128& o) const { return !(*this == o); }
    constexpr bool operator<(const Uint128& o) const {
        return high < o.high || (high == o.high && low < o.low);
    }
};

// 128 random bits. Unlike a v4 UUID no bits are reserved for version or
// variant. Immutable once built; the default value is nil.
class Yyid {
public:
    static constexpr size_t LENGTH = 16;

    constexpr Yyid() : bytes_{} {}

    static constexpr Yyid nil() { return Yyid(); }
    static constexpr Yyid from_bytes(const YyidBytes& bytes) { return Yyid(bytes); }
    static Yyid from_u128(Uint128 value);
    static Yyid from_u128_le(Uint128 value);

    // Draws from system_entropy(). Terminates the process if the platform
    // cannot supply random bytes.
    static Yyid random();

    static Result<Yyid> generate(EntropySource& source);

    constexpr bool is_nil() const {
        for (size_t i = 0; i < LENGTH; ++i) {
            if (bytes_[i] != 0) return false;
        }
        return true;
    }

    constexpr const YyidBytes& as_bytes() const { return bytes_; }

    // Byte 0 is the most significant byte.
    Uint128 to_u128() const;
    // Byte 0 is the least significant byte.
    Uint128 to_u128_le() const;

    bool operator==(const Yyid& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const Yyid& o) const { return bytes_ != o.bytes_; }
    bool operator<(const Yyid& o) const { return bytes_ < o.bytes_; }
    bool operator<=(const Yyid& o) const { return bytes_ <= o.bytes_; }
    bool operator>(const Yyid& o) const { return bytes_ > o.bytes_; }
    bool operator>=(const Yyid& o) const { return bytes_ >= o.bytes_; }

private:
    constexpr explicit Yyid(const YyidBytes& bytes) : bytes_(bytes) {}

    YyidBytes bytes_;
};

static_assert(sizeof(Yyid) == Yyid::LENGTH, "Yyid must be exactly 16 bytes");
static_assert(alignof(Yyid) == 1, "Yyid must be byte aligned");

// FNV-1a over the raw bytes
size_t hash_bytes(const YyidBytes& bytes);

} // namespace yyid

namespace std {
template<>
struct hash<yyid::Yyid> {
    size_t operator()(const yyid::Yyid& id) const noexcept {
        return yyid::hash_bytes(id.as_bytes());
    }
};
} // namespace std
