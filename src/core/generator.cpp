#include <ulid/generator.hpp>
#include <ulid/field.hpp>
#include <ulid/validate.hpp>

namespace ulid {

Generator::Generator()
    : clock_(default_time_source()),
      random_(default_random_source()),
      codec_(default_codec()) {}

Generator::Generator(TimeSource& clock, RandomSource& random, const Base32Codec& codec)
    : clock_(clock), random_(random), codec_(codec) {}

Result<std::string> Generator::generate() {
    return generate(clock_.now_ms());
}

Result<std::string> Generator::generate(std::int64_t time) {
    auto checked = validate_time(time);
    ULID_TRY(checked);

    RandomBytes randomness{};
    ULID_TRY(random_.fill(randomness.data(), randomness.size()));

    auto time_field = encode_field(codec_, checked.value(), kTimeChars);
    ULID_TRY(time_field);
    auto random_field = encode_field(codec_,
        std::vector<uint8_t>(randomness.begin(), randomness.end()), kRandomChars);
    ULID_TRY(random_field);

    return Result<std::string>::ok(time_field.value() + random_field.value());
}

} // namespace ulid
