#pragma once

#include <ulid/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulid {

// Supplies the current time in milliseconds since the Unix epoch.
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual std::int64_t now_ms() = 0;
};

// Supplies cryptographically secure random bytes.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Fills buf[0..len) completely or fails; a partial fill is an error.
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

class SystemClock : public TimeSource {
public:
    std::int64_t now_ms() override;
};

// Reads from a random device, /dev/urandom unless told otherwise. The device
// is opened per call, so one instance may be shared between threads.
class UrandomSource : public RandomSource {
public:
    UrandomSource();
    explicit UrandomSource(std::string device);

    Status fill(uint8_t* buf, size_t len) override;

    const std::string& device() const { return device_; }

private:
    std::string device_;
};

// Process-wide defaults used by the free functions in <ulid/ulid.hpp>.
TimeSource& default_time_source();
RandomSource& default_random_source();

} // namespace ulid
