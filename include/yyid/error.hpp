#pragma once

#include <string>

namespace yyid {

struct YyidError {
    enum Code {
        IO,
        Parse,
        Config,
        Entropy,
        Conversion,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    YyidError() = default;
    YyidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    YyidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace yyid
