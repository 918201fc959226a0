#pragma once

#include <ulid/crockford.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ulid {

constexpr size_t kTimeBytes = 6;
constexpr size_t kRandomBytes = 10;
constexpr size_t kUlidBytes = kTimeBytes + kRandomBytes;

constexpr size_t kTimeChars = 10;
constexpr size_t kRandomChars = 16;
constexpr size_t kUlidChars = kTimeChars + kRandomChars;

using TimeBytes = std::array<uint8_t, kTimeBytes>;
using RandomBytes = std::array<uint8_t, kRandomBytes>;
using Bytes16 = std::array<uint8_t, kUlidBytes>;

// Normalizes a codec output to exactly `width` characters. Significant
// digits are right-aligned: longer input loses characters on the left,
// shorter input is left-padded with '0' (the zero symbol).
std::string format_encoded(const std::string& encoded, size_t width);

// Codec-encode then normalize. Codec failures propagate unchanged.
Result<std::string> encode_field(const Base32Codec& codec, std::uint64_t value, size_t width);
Result<std::string> encode_field(const Base32Codec& codec,
                                 const std::vector<uint8_t>& bytes, size_t width);

} // namespace ulid
