#include <ulid/error.hpp>
#include <cstdio>

namespace ulid {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case InvalidTimeType:     return "InvalidTimeType";
        case NegativeTime:        return "NegativeTime";
        case TimeOverflow:        return "TimeOverflow";
        case MalformedLength:     return "MalformedLength";
        case DecodedTimeOverflow: return "DecodedTimeOverflow";
        case Codec:               return "Codec";
        case IO:                  return "IO";
        case Config:              return "Config";
        case Parse:               return "Parse";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

std::string UlidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

std::string inspect(const std::string& s) {
    std::string out = "\"";
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c >= 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '"';
    return out;
}

} // namespace ulid
