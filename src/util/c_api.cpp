#include <yyid/yyid.h>
#include <yyid/codec.hpp>
#include <yyid/log.hpp>
#include <cstdlib>
#include <cstring>

using namespace yyid;

extern "C" char* yyid_c_string(void) {
    auto r = Yyid::generate(system_entropy());
    if (r.is_err()) {
        log::error("%s", r.error().format().c_str());
        return nullptr;
    }

    char* out = static_cast<char*>(std::malloc(Hyphenated::LENGTH + 1));
    if (!out) return nullptr;
    Hyphenated(r.value()).encode_lower(out, Hyphenated::LENGTH);
    out[Hyphenated::LENGTH] = '\0';
    return out;
}

extern "C" void yyid_c_string_free(char* s) {
    std::free(s);
}

extern "C" int yyid_c_encode(const uint8_t bytes[16], int format, int upper,
                             char* buf, size_t len) {
    if (!bytes || !buf) return -1;
    if (format < YYID_FORMAT_SIMPLE || format > YYID_FORMAT_URN) return -1;

    Format fmt = static_cast<Format>(format);
    size_t need = format_length(fmt);
    if (len < need + 1) return -1;

    YyidBytes raw;
    std::memcpy(raw.data(), bytes, raw.size());
    detail::encode_into(raw, fmt, upper != 0, buf);
    buf[need] = '\0';
    return static_cast<int>(need);
}
