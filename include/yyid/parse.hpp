#pragma once

#include <yyid/codec.hpp>
#include <yyid/result.hpp>
#include <yyid/yyid.hpp>
#include <string_view>

namespace yyid {

// Parse any of the four text encodings, told apart by length:
//
//   simple      2ff0b694960e88a4693a66cff98fc56c
//   hyphenated  02e7f0f6-067e-8c92-b25c-12c9180540a9
//   braced      {02e7f0f6-067e-8c92-b25c-12c9180540a9}
//   urn         urn:yyid:02e7f0f6-067e-8c92-b25c-12c9180540a9
//
// Hex digits may be either case. Punctuation must sit exactly where the
// encoder puts it; surrounding whitespace is not accepted.
Result<Yyid> parse_yyid(std::string_view text);

// Same, but only the given encoding is accepted.
Result<Yyid> parse_as(Format fmt, std::string_view text);

} // namespace yyid
