#pragma once

#include <ulid/crockford.hpp>
#include <ulid/result.hpp>
#include <ulid/source.hpp>
#include <cstdint>
#include <string>

namespace ulid {

// Produces 26-character textual ULIDs from a clock and a random source.
// Holds references only; the sources and codec must outlive the generator.
// No sequence counter: two ULIDs from the same millisecond are ordered by
// their random part only.
class Generator {
public:
    Generator();
    Generator(TimeSource& clock, RandomSource& random,
              const Base32Codec& codec = default_codec());

    // Reads the clock once, then behaves as generate(time).
    Result<std::string> generate();

    // NegativeTime / TimeOverflow for out-of-range time, IO if the random
    // source fails, Codec if the codec fails.
    Result<std::string> generate(std::int64_t time);

private:
    TimeSource& clock_;
    RandomSource& random_;
    const Base32Codec& codec_;
};

} // namespace ulid
