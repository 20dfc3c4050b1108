#pragma once

#include <string>

namespace vercmp {

struct VercmpError {
    enum Code {
        IO,
        Parse,
        Version,
        Constraint,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    VercmpError() = default;
    VercmpError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VercmpError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace vercmp
