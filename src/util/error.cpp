#include <yyid/error.hpp>

namespace yyid {

const char* YyidError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Entropy:    return "Entropy";
        case Conversion: return "Conversion";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string YyidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace yyid
