#include <idforge/error.hpp>

namespace idforge {

const char* IdError::code_name(Code c) {
    switch (c) {
        case InvalidArg: return "InvalidArg";
        case OutOfRange: return "OutOfRange";
        case Malformed:  return "Malformed";
        case Parse:      return "Parse";
        case Digest:     return "Digest";
        case Entropy:    return "Entropy";
        case IO:         return "IO";
        case Config:     return "Config";
    }
    return "Unknown";
}

std::string IdError::format() const {
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

} // namespace idforge
