#include <yyid/entropy.hpp>
#include <yyid/log.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

#ifdef __linux__
#include <sys/random.h>
#endif

namespace yyid {

static Status read_urandom(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (!urandom.is_open()) {
        return YyidError{YyidError::Entropy,
            "cannot open /dev/urandom",
            "the platform offers no secure random source"};
    }
    urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (static_cast<size_t>(urandom.gcount()) != len) {
        return YyidError{YyidError::Entropy,
            "short read from /dev/urandom: got " + std::to_string(urandom.gcount()) +
            " of " + std::to_string(len) + " bytes"};
    }
    return ok_status();
}

Status SystemEntropy::fill(uint8_t* buf, size_t len) {
#ifdef __linux__
    size_t filled = 0;
    while (filled < len) {
        ssize_t n = getrandom(buf + filled, len - filled, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == ENOSYS) {
                log::debug("getrandom unavailable, reading /dev/urandom");
                return read_urandom(buf, len);
            }
            return YyidError{YyidError::Entropy,
                std::string("getrandom failed: ") + std::strerror(errno)};
        }
        filled += static_cast<size_t>(n);
    }
    return ok_status();
#else
    return read_urandom(buf, len);
#endif
}

EntropySource& system_entropy() {
    static SystemEntropy source;
    return source;
}

} // namespace yyid
