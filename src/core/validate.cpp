#include <ulid/validate.hpp>
#include <charconv>
#include <system_error>

namespace ulid {

Result<std::uint64_t> validate_time(std::int64_t time) {
    if (time < 0) {
        return UlidError{UlidError::NegativeTime,
            "time cannot be negative, got " + std::to_string(time)};
    }
    auto t = static_cast<std::uint64_t>(time);
    if (t > kMaxTime) {
        return UlidError{UlidError::TimeOverflow,
            "time cannot be >= 2^48 milliseconds, got " + std::to_string(time),
            "the largest encodable time is " + std::to_string(kMaxTime)};
    }
    return Result<std::uint64_t>::ok(t);
}

Result<std::uint64_t> validate_decoded_time(std::uint64_t time) {
    if (time > kMaxTime) {
        return UlidError{UlidError::DecodedTimeOverflow,
            "the decoded time cannot be greater than 2^48, got " + std::to_string(time),
            "the first character of a valid ULID is between 0 and 7"};
    }
    return Result<std::uint64_t>::ok(time);
}

Result<std::int64_t> parse_time(const std::string& text) {
    UlidError bad{UlidError::InvalidTimeType,
        "time must be an integer, got " + inspect(text)};

    size_t digits_at = (!text.empty() && text[0] == '-') ? 1 : 0;
    if (digits_at == text.size()) return bad;
    for (size_t i = digits_at; i < text.size(); ++i) {
        if (text[i] < '0' || text[i] > '9') return bad;
    }

    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto rc = std::from_chars(first, last, value);
    if (rc.ec != std::errc{} || rc.ptr != last) {
        bad.hint = "value does not fit in a signed 64-bit integer";
        return bad;
    }
    return Result<std::int64_t>::ok(value);
}

} // namespace ulid
