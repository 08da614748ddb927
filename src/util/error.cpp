#include <shortguid/error.hpp>

namespace shortguid {

const char* ShortGuidError::code_name(Code c) {
    switch (c) {
        case InvalidLength:         return "InvalidLength";
        case InvalidEncoding:       return "InvalidEncoding";
        case DecodedLengthMismatch: return "DecodedLengthMismatch";
        case IO:                    return "IO";
        case Parse:                 return "Parse";
        case Config:                return "Config";
        case NotFound:              return "NotFound";
        case InvalidArg:            return "InvalidArg";
    }
    return "Unknown";
}

std::string ShortGuidError::format() const {
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

} // namespace shortguid
