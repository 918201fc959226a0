#include <ulid/field.hpp>

namespace ulid {

std::string format_encoded(const std::string& encoded, size_t width) {
    if (encoded.size() > width) {
        return encoded.substr(encoded.size() - width);
    }
    if (encoded.size() < width) {
        return std::string(width - encoded.size(), '0') + encoded;
    }
    return encoded;
}

Result<std::string> encode_field(const Base32Codec& codec, std::uint64_t value, size_t width) {
    return codec.encode32_unsigned(value).map([width](std::string& encoded) {
        return format_encoded(encoded, width);
    });
}

Result<std::string> encode_field(const Base32Codec& codec,
                                 const std::vector<uint8_t>& bytes, size_t width) {
    return codec.encode32(bytes).map([width](std::string& encoded) {
        return format_encoded(encoded, width);
    });
}

} // namespace ulid
