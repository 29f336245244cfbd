#pragma once

#include <string>

namespace nixup {

struct NixupError {
    enum Code {
        IO,
        Parse,
        Config,
        State,
        Database,
        Command,
        NotFound,
        Permission,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string path;
    int line = 0;

    NixupError() = default;
    NixupError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    NixupError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    NixupError(Code c, std::string msg, std::string h, std::string p, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          path(std::move(p)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace nixup
