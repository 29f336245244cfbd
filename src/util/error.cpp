#include <nixup/error.hpp>

namespace nixup {

const char* NixupError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case State:      return "State";
        case Database:   return "Database";
        case Command:    return "Command";
        case NotFound:   return "NotFound";
        case Permission: return "Permission";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string NixupError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!path.empty()) {
        result += "\n  --> ";
        result += path;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace nixup
