#include <catch2/catch.hpp>
#include <ulid/validate.hpp>

using namespace ulid;

TEST_CASE("kMaxTime is 2^48 - 1", "[validate]") {
    REQUIRE(kMaxTime == (std::uint64_t{1} << 48) - 1);
}

TEST_CASE("validate_time accepts the full 48-bit range", "[validate]") {
    REQUIRE(validate_time(0).value() == 0);
    REQUIRE(validate_time(1469918176385LL).value() == 1469918176385ULL);
    REQUIRE(validate_time(281474976710655LL).value() == kMaxTime);
}

TEST_CASE("validate_time rejects negative time", "[validate]") {
    auto r = validate_time(-1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::NegativeTime);
    REQUIRE(r.error().message.find("-1") != std::string::npos);
}

TEST_CASE("validate_time rejects time past 2^48 - 1", "[validate]") {
    auto r = validate_time(281474976710656LL);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::TimeOverflow);
    REQUIRE(r.error().message.find("281474976710656") != std::string::npos);
}

TEST_CASE("validate_decoded_time bounds", "[validate]") {
    REQUIRE(validate_decoded_time(kMaxTime).is_ok());
    auto r = validate_decoded_time(kMaxTime + 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::DecodedTimeOverflow);
}

TEST_CASE("parse_time accepts decimal integers", "[validate]") {
    REQUIRE(parse_time("0").value() == 0);
    REQUIRE(parse_time("1469918176385").value() == 1469918176385LL);
    REQUIRE(parse_time("-1").value() == -1);
    REQUIRE(parse_time("281474976710656").value() == 281474976710656LL);
}

TEST_CASE("parse_time rejects non-integer input", "[validate]") {
    for (const char* bad : {"x", "", "-", "1.5", "12ms", " 1", "1 ", "+1", "0x10", "1e3"}) {
        auto r = parse_time(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == UlidError::InvalidTimeType);
    }
}

TEST_CASE("parse_time reports the offending input", "[validate]") {
    auto r = parse_time("x");
    REQUIRE(r.error().message == "time must be an integer, got \"x\"");
}

TEST_CASE("parse_time rejects values beyond int64", "[validate]") {
    auto r = parse_time("99999999999999999999");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::InvalidTimeType);
}

TEST_CASE("parsed time feeds the range check", "[validate]") {
    auto r = parse_time("281474976710656").and_then([](std::int64_t t) {
        return validate_time(t);
    });
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::TimeOverflow);
}
