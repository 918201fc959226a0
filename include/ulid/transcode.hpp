#pragma once

#include <ulid/crockford.hpp>
#include <ulid/field.hpp>
#include <ulid/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ulid {

// Result of decode(): the time fully decoded and range-checked, the
// randomness still as its 16-character Base32 field.
struct Decoded {
    std::uint64_t time = 0;
    std::string randomness;
};

// ---- Binary layout helpers ----

// Big-endian 48-bit time from bytes[0..6).
std::uint64_t time_of(const Bytes16& bytes);
RandomBytes randomness_of(const Bytes16& bytes);

// Inverse of time_of()/randomness_of(). Bits of `time` above bit 47 are
// dropped; callers validate the time first.
Bytes16 pack(std::uint64_t time, const RandomBytes& randomness);

// Uppercase hex digits, two per byte, no prefix.
std::string to_hex(const std::vector<uint8_t>& bytes);

// ---- Text <-> binary ----

// 16 bytes -> 26 characters. Fails only if the codec does.
Result<std::string> encode(const Bytes16& bytes,
                           const Base32Codec& codec = default_codec());

// MalformedLength unless text is 26 characters. The time field is decoded
// and checked (DecodedTimeOverflow); the randomness field is only checked
// against the alphabet and returned as text.
Result<Decoded> decode(const std::string& text,
                       const Base32Codec& codec = default_codec());

// Decoded bytes of a 16-character randomness field, e.g. Decoded::randomness.
Result<RandomBytes> decode_randomness(const std::string& field,
                                      const Base32Codec& codec = default_codec());

// Whole-string decode without the field split or the time range check.
// Canonical input yields 16 bytes; a leading symbol above '7' yields 17.
Result<std::vector<uint8_t>> to_binary(const std::string& text,
                                       const Base32Codec& codec = default_codec());

} // namespace ulid
