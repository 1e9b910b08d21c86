#ifndef YYID_YYID_H
#define YYID_YYID_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

enum yyid_format {
    YYID_FORMAT_SIMPLE = 0,
    YYID_FORMAT_HYPHENATED = 1,
    YYID_FORMAT_BRACED = 2,
    YYID_FORMAT_URN = 3
};

/* New random YYID, hyphenated lower case and NUL-terminated. Release with
 * yyid_c_string_free(). Returns NULL if no secure random source is usable. */
char* yyid_c_string(void);

void yyid_c_string_free(char* s);

/* Encode 16 bytes into buf, NUL-terminated. Returns the number of
 * characters written (excluding the NUL), or -1 on a bad format or a
 * buffer shorter than the encoding plus terminator. */
int yyid_c_encode(const uint8_t bytes[16], int format, int upper,
                  char* buf, size_t len);

#ifdef __cplusplus
}
#endif

#endif /* YYID_YYID_H */
