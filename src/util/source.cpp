#include <ulid/source.hpp>
#include <ulid/log.hpp>
#include <chrono>
#include <fstream>

namespace ulid {

std::int64_t SystemClock::now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

UrandomSource::UrandomSource() : device_("/dev/urandom") {}

UrandomSource::UrandomSource(std::string device) : device_(std::move(device)) {}

Status UrandomSource::fill(uint8_t* buf, size_t len) {
    std::ifstream in(device_, std::ios::binary);
    if (!in.is_open()) {
        log::debug("cannot open random device %s", device_.c_str());
        return UlidError{UlidError::IO,
            "cannot open random device: " + device_,
            "set [random] device to a readable source of secure random bytes"};
    }
    in.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    auto got = static_cast<size_t>(in.gcount());
    if (got != len) {
        log::debug("short read from %s: %zu of %zu bytes", device_.c_str(), got, len);
        return UlidError{UlidError::IO,
            "short read from random device " + device_ + ": got " +
                std::to_string(got) + " of " + std::to_string(len) + " bytes"};
    }
    return ok_status();
}

TimeSource& default_time_source() {
    static SystemClock clock;
    return clock;
}

RandomSource& default_random_source() {
    static UrandomSource source;
    return source;
}

} // namespace ulid
