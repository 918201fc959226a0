#pragma once

#include <ulid/result.hpp>
#include <cstdint>
#include <string>

namespace ulid {

// Largest timestamp a ULID can carry: 2^48 - 1 milliseconds.
constexpr std::uint64_t kMaxTime = 281474976710655ULL;

// Generation-side bound check: NegativeTime, TimeOverflow.
Result<std::uint64_t> validate_time(std::int64_t time);

// Decode-side bound check: DecodedTimeOverflow. Such a value could never
// have been produced by the generator.
Result<std::uint64_t> validate_decoded_time(std::uint64_t time);

// Parses a decimal millisecond timestamp. Only an optional '-' followed by
// digits is accepted; fractions, units, whitespace and values outside the
// int64 range are InvalidTimeType. The range check against kMaxTime is left
// to validate_time().
Result<std::int64_t> parse_time(const std::string& text);

} // namespace ulid
