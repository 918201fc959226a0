#pragma once

#include <string>

namespace ulid {

struct UlidError {
    enum Code {
        InvalidTimeType,
        NegativeTime,
        TimeOverflow,
        MalformedLength,
        DecodedTimeOverflow,
        Codec,
        IO,
        Config,
        Parse,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    UlidError() = default;
    UlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    UlidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

// Renders a string the way it should appear inside an error message:
// double-quoted, with quotes, backslashes and control bytes escaped.
std::string inspect(const std::string& s);

} // namespace ulid
