#pragma once

#include <string>

namespace idforge {

struct IdError {
    enum Code {
        InvalidArg,
        OutOfRange,
        Malformed,
        Parse,
        Digest,
        Entropy,
        IO,
        Config
    };

    Code code;
    std::string message;
    std::string hint;

    IdError() = default;
    IdError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    IdError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace idforge
