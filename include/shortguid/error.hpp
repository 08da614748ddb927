#pragma once

#include <string>

namespace shortguid {

struct ShortGuidError {
    enum Code {
        InvalidLength,
        InvalidEncoding,
        DecodedLengthMismatch,
        IO,
        Parse,
        Config,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    ShortGuidError() = default;
    ShortGuidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    ShortGuidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace shortguid
