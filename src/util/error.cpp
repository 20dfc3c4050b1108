#include <vercmp/error.hpp>

namespace vercmp {

const char* VercmpError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Version:    return "Version";
        case Constraint: return "Constraint";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string VercmpError::format() const {
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

} // namespace vercmp
