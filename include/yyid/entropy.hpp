#pragma once

#include <yyid/result.hpp>
#include <cstddef>
#include <cstdint>

namespace yyid {

// Source of cryptographically suitable random bytes. Implementations must
// be safe to call from several threads at once. A failed fill must be
// reported, never papered over with predictable bytes.
class EntropySource {
public:
    virtual ~EntropySource() = default;
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// getrandom(2), or /dev/urandom on kernels without the syscall.
class SystemEntropy : public EntropySource {
public:
    Status fill(uint8_t* buf, size_t len) override;
};

// Process-wide SystemEntropy used by Yyid::random().
EntropySource& system_entropy();

} // namespace yyid
