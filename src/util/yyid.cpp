#include <yyid/yyid.hpp>
#include <yyid/log.hpp>
#include <cstdlib>

namespace yyid {

Result<Yyid> Yyid::generate(EntropySource& source) {
    YyidBytes bytes{};
    YYID_TRY(source.fill(bytes.data(), bytes.size()));
    return Result<Yyid>::ok(Yyid(bytes));
}

Yyid Yyid::random() {
    auto r = generate(system_entropy());
    if (r.is_err()) {
        log::error("%s", r.error().format().c_str());
        log::error("refusing to continue without a secure random source");
        std::abort();
    }
    return r.value();
}

// ---- 128-bit views ----

Uint128 Yyid::to_u128() const {
    Uint128 v;
    for (size_t i = 0; i < 8; ++i) {
        v.high = (v.high << 8) | bytes_[i];
        v.low = (v.low << 8) | bytes_[i + 8];
    }
    return v;
}

Uint128 Yyid::to_u128_le() const {
    Uint128 v;
    for (size_t i = 0; i < 8; ++i) {
        v.high = (v.high << 8) | bytes_[15 - i];
        v.low = (v.low << 8) | bytes_[7 - i];
    }
    return v;
}

Yyid Yyid::from_u128(Uint128 value) {
    YyidBytes bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[7 - i] = static_cast<uint8_t>(value.high >> (i * 8));
        bytes[15 - i] = static_cast<uint8_t>(value.low >> (i * 8));
    }
    return Yyid(bytes);
}

Yyid Yyid::from_u128_le(Uint128 value) {
    YyidBytes bytes{};
    for (size_t i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(value.low >> (i * 8));
        bytes[i + 8] = static_cast<uint8_t>(value.high >> (i * 8));
    }
    return Yyid(bytes);
}

size_t hash_bytes(const YyidBytes& bytes) {
    uint64_t h = 0xcbf29ce484222325ull;
    for (uint8_t b : bytes) {
        h ^= b;
        h *= 0x100000001b3ull;
    }
    return static_cast<size_t>(h);
}

} // namespace yyid
