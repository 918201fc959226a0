#include <ulid/crockford.hpp>

namespace ulid {

const char kCrockfordAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

Result<std::string> Base32Codec::encode32_unsigned(std::uint64_t value) const {
    std::vector<uint8_t> bytes;
    for (int shift = 56; shift >= 0; shift -= 8) {
        auto b = static_cast<uint8_t>((value >> shift) & 0xFF);
        if (bytes.empty() && b == 0 && shift > 0) continue;
        bytes.push_back(b);
    }
    return encode32(bytes);
}

int CrockfordCodec::symbol_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    if (c < 'A' || c > 'Z') return -1;
    for (int i = 10; i < 32; ++i) {
        if (kCrockfordAlphabet[i] == c) return i;
    }
    return -1;
}

Result<std::string> CrockfordCodec::encode32(const std::vector<uint8_t>& bytes) const {
    std::string out;
    if (bytes.empty()) return Result<std::string>::ok(out);

    const size_t total_bits = bytes.size() * 8;
    out.reserve((total_bits + 4) / 5);

    // Leading zero padding bits are already "in" the accumulator.
    uint32_t acc = 0;
    unsigned acc_bits = static_cast<unsigned>((5 - total_bits % 5) % 5);
    for (uint8_t b : bytes) {
        acc = (acc << 8) | b;
        acc_bits += 8;
        while (acc_bits >= 5) {
            acc_bits -= 5;
            out += kCrockfordAlphabet[(acc >> acc_bits) & 0x1F];
        }
        acc &= (1u << acc_bits) - 1;
    }
    return Result<std::string>::ok(std::move(out));
}

Result<std::vector<uint8_t>> CrockfordCodec::decode32(const std::string& text) const {
    std::vector<uint8_t> values;
    values.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        int v = symbol_value(text[i]);
        if (v < 0) {
            return UlidError{UlidError::Codec,
                "invalid Crockford Base32 character " +
                    inspect(std::string(1, text[i])) + " at position " +
                    std::to_string(i) + " in " + inspect(text),
                "alphabet is 0123456789ABCDEFGHJKMNPQRSTVWXYZ (no I, L, O, U)"};
        }
        values.push_back(static_cast<uint8_t>(v));
    }

    std::vector<uint8_t> out;
    const size_t total_bits = text.size() * 5;
    const unsigned top_bits = static_cast<unsigned>(total_bits % 8);
    out.reserve(total_bits / 8 + 1);

    // Bytes are aligned to the low end, so the first chunk holds only the
    // top_bits leftover high-order bits.
    unsigned need = top_bits ? top_bits : 8;
    uint32_t acc = 0;
    unsigned acc_bits = 0;
    for (uint8_t v : values) {
        acc = (acc << 5) | v;
        acc_bits += 5;
        while (acc_bits >= need) {
            acc_bits -= need;
            out.push_back(static_cast<uint8_t>((acc >> acc_bits) & ((1u << need) - 1)));
            acc &= (1u << acc_bits) - 1;
            need = 8;
        }
    }

    if (top_bits != 0 && !out.empty() && out.front() == 0) {
        out.erase(out.begin());
    }
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

const Base32Codec& default_codec() {
    static const CrockfordCodec codec;
    return codec;
}

} // namespace ulid
