#include <ulid/transcode.hpp>
#include <ulid/validate.hpp>
#include <algorithm>
#include <cstddef>
#include <cstdio>

namespace ulid {

static UlidError malformed_length(const char* what, const std::string& text, size_t expected) {
    return UlidError{UlidError::MalformedLength,
        std::string(what) + " must be " + std::to_string(expected) +
            " characters long, got " + inspect(text),
        "got " + std::to_string(text.size()) + " characters"};
}

// Interprets decoded time bytes as an unsigned big-endian integer.
static Result<std::uint64_t> read_time(const std::vector<uint8_t>& bytes) {
    if (bytes.size() > sizeof(std::uint64_t)) {
        return UlidError{UlidError::DecodedTimeOverflow,
            "the decoded time cannot be greater than 2^48, got 0x" + to_hex(bytes)};
    }
    std::uint64_t value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return validate_decoded_time(value);
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    char buf[3];
    for (uint8_t b : bytes) {
        std::snprintf(buf, sizeof(buf), "%02X", b);
        out += buf;
    }
    return out;
}

std::uint64_t time_of(const Bytes16& bytes) {
    std::uint64_t t = 0;
    for (size_t i = 0; i < kTimeBytes; ++i) {
        t = (t << 8) | bytes[i];
    }
    return t;
}

RandomBytes randomness_of(const Bytes16& bytes) {
    RandomBytes r{};
    for (size_t i = 0; i < kRandomBytes; ++i) {
        r[i] = bytes[kTimeBytes + i];
    }
    return r;
}

Bytes16 pack(std::uint64_t time, const RandomBytes& randomness) {
    Bytes16 out{};
    for (size_t i = 0; i < kTimeBytes; ++i) {
        out[i] = static_cast<uint8_t>((time >> ((kTimeBytes - 1 - i) * 8)) & 0xFF);
    }
    for (size_t i = 0; i < kRandomBytes; ++i) {
        out[kTimeBytes + i] = randomness[i];
    }
    return out;
}

Result<std::string> encode(const Bytes16& bytes, const Base32Codec& codec) {
    // A 6-byte time is at most 2^48 - 1, so no range check is needed here.
    RandomBytes randomness = randomness_of(bytes);
    auto time_field = encode_field(codec, time_of(bytes), kTimeChars);
    ULID_TRY(time_field);
    auto random_field = encode_field(codec,
        std::vector<uint8_t>(randomness.begin(), randomness.end()), kRandomChars);
    ULID_TRY(random_field);
    return Result<std::string>::ok(time_field.value() + random_field.value());
}

Result<Decoded> decode(const std::string& text, const Base32Codec& codec) {
    if (text.size() != kUlidChars) {
        return malformed_length("the ULID", text, kUlidChars);
    }
    std::string time_field = text.substr(0, kTimeChars);
    std::string random_field = text.substr(kTimeChars);

    auto time_bytes = codec.decode32(time_field);
    ULID_TRY(time_bytes);
    auto decoded_time = read_time(time_bytes.value());
    ULID_TRY(decoded_time);
    ULID_TRY(codec.decode32(random_field));

    Decoded d;
    d.time = decoded_time.value();
    d.randomness = std::move(random_field);
    return Result<Decoded>::ok(std::move(d));
}

Result<RandomBytes> decode_randomness(const std::string& field, const Base32Codec& codec) {
    if (field.size() != kRandomChars) {
        return malformed_length("the randomness field", field, kRandomChars);
    }
    auto decoded = codec.decode32(field);
    ULID_TRY(decoded);
    const auto& bytes = decoded.value();
    if (bytes.size() > kRandomBytes) {
        return UlidError{UlidError::Codec,
            "randomness field " + inspect(field) + " decoded to " +
                std::to_string(bytes.size()) + " bytes"};
    }
    // Right-align: a codec may return fewer bytes for a value with leading zeros.
    RandomBytes out{};
    std::copy(bytes.begin(), bytes.end(),
              out.end() - static_cast<std::ptrdiff_t>(bytes.size()));
    return Result<RandomBytes>::ok(out);
}

Result<std::vector<uint8_t>> to_binary(const std::string& text, const Base32Codec& codec) {
    if (text.size() != kUlidChars) {
        return malformed_length("the ULID", text, kUlidChars);
    }
    return codec.decode32(text);
}

} // namespace ulid
