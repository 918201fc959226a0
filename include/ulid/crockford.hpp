#pragma once

#include <ulid/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace ulid {

// Crockford's Base32 alphabet: digits and uppercase letters without I, L, O, U.
extern const char kCrockfordAlphabet[];

// Binary <-> Base32 text codec used by the ULID encoder and decoder.
class Base32Codec {
public:
    virtual ~Base32Codec() = default;

    // Minimal, not fixed-width, representation of `bytes`.
    virtual Result<std::string> encode32(const std::vector<uint8_t>& bytes) const = 0;

    // Inverse of encode32(). Fails on any character outside the alphabet.
    virtual Result<std::vector<uint8_t>> decode32(const std::string& text) const = 0;

    // Encodes the minimal big-endian byte form of `value` (at least one byte).
    Result<std::string> encode32_unsigned(std::uint64_t value) const;
};

// The bit string of the input is left-padded with zero bits to a multiple
// of five and emitted five bits per symbol, most significant first:
//   6 bytes -> 10 chars, 10 bytes -> 16 chars, 16 bytes -> 26 chars.
//
// Decoding is case-insensitive. n symbols carry 5n bits; the output is the
// low floor(5n/8) bytes, with one extra leading byte only when the leftover
// high-order 5n mod 8 bits are not all zero.
class CrockfordCodec : public Base32Codec {
public:
    Result<std::string> encode32(const std::vector<uint8_t>& bytes) const override;
    Result<std::vector<uint8_t>> decode32(const std::string& text) const override;

    // Symbol value 0..31, or -1 if `c` is not in the alphabet.
    static int symbol_value(char c);
};

// Shared CrockfordCodec instance used when no codec is supplied.
const Base32Codec& default_codec();

} // namespace ulid
