#include <catch2/catch.hpp>
#include <ulid/result.hpp>
#include <memory>
#include <string>

using namespace ulid;

static Result<int> try_double(Result<int> input) {
    ULID_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<std::string> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(UlidError{UlidError::DecodedTimeOverflow, "2^48"})
        : Result<int>::ok(42);
    ULID_TRY(first);
    return Result<std::string>::ok(std::to_string(first.value()));
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<std::string>::ok("01ARYZ6S41");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == "01ARYZ6S41");
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(UlidError{UlidError::NegativeTime, "time cannot be negative, got -1"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == UlidError::NegativeTime);
    REQUIRE(r.error().message == "time cannot be negative, got -1");
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(UlidError{UlidError::Codec, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(UlidError{UlidError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("map() transforms Ok and passes Err through", "[result]") {
    auto mapped = Result<int>::ok(5).map([](int x) { return x * 2; });
    REQUIRE(mapped.value() == 10);

    bool called = false;
    auto failed = Result<int>::err(UlidError{UlidError::MalformedLength, "short"})
        .map([&](int x) { called = true; return x; });
    REQUIRE(failed.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(failed.error().code == UlidError::MalformedLength);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto chained = Result<int>::ok(5).and_then([](int x) {
        return Result<std::string>::ok(std::to_string(x + 10));
    });
    REQUIRE(chained.value() == "15");

    bool called = false;
    auto stopped = Result<int>::err(UlidError{UlidError::TimeOverflow, "big"})
        .and_then([&](int x) { called = true; return Result<int>::ok(x); });
    REQUIRE(stopped.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("or_else() recovers from Err only", "[result]") {
    auto kept = Result<int>::ok(5).or_else([](UlidError&) { return Result<int>::ok(99); });
    REQUIRE(kept.value() == 5);

    auto recovered = Result<int>::err(UlidError{UlidError::IO, "disk"})
        .or_else([](UlidError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("ULID_TRY propagates errors unchanged", "[result]") {
    auto out = try_double(Result<int>::err(UlidError{UlidError::Codec, "bad symbol", "hint"}));
    REQUIRE(out.is_err());
    REQUIRE(out.error().code == UlidError::Codec);
    REQUIRE(out.error().message == "bad symbol");
    REQUIRE(out.error().hint == "hint");

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("ULID_TRY across Result types", "[result]") {
    REQUIRE(try_chain(false).value() == "42");

    auto r = try_chain(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::DecodedTimeOverflow);
}

TEST_CASE("Status ok and err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(UlidError{UlidError::Config, "bad config"});
    REQUIRE(s.error().code == UlidError::Config);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

TEST_CASE("UlidError format() output", "[error]") {
    UlidError e{UlidError::IO, "cannot open config file: x.toml", "check the path", "x.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("cannot open config file") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> x.toml:3") != std::string::npos);
}

TEST_CASE("UlidError format() without hint or file", "[error]") {
    UlidError e{UlidError::MalformedLength, "the ULID must be 26 characters long"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[MalformedLength]: the ULID must be 26 characters long");
}

TEST_CASE("UlidError code_name() for all codes", "[error]") {
    REQUIRE(std::string(UlidError::code_name(UlidError::InvalidTimeType)) == "InvalidTimeType");
    REQUIRE(std::string(UlidError::code_name(UlidError::NegativeTime)) == "NegativeTime");
    REQUIRE(std::string(UlidError::code_name(UlidError::TimeOverflow)) == "TimeOverflow");
    REQUIRE(std::string(UlidError::code_name(UlidError::MalformedLength)) == "MalformedLength");
    REQUIRE(std::string(UlidError::code_name(UlidError::DecodedTimeOverflow)) == "DecodedTimeOverflow");
    REQUIRE(std::string(UlidError::code_name(UlidError::Codec)) == "Codec");
    REQUIRE(std::string(UlidError::code_name(UlidError::IO)) == "IO");
    REQUIRE(std::string(UlidError::code_name(UlidError::Config)) == "Config");
    REQUIRE(std::string(UlidError::code_name(UlidError::Parse)) == "Parse");
    REQUIRE(std::string(UlidError::code_name(UlidError::InvalidArg)) == "InvalidArg");
}

TEST_CASE("inspect() quotes and escapes", "[error]") {
    REQUIRE(inspect("abc") == "\"abc\"");
    REQUIRE(inspect("") == "\"\"");
    REQUIRE(inspect("a\"b") == "\"a\\\"b\"");
    REQUIRE(inspect("a\nb") == "\"a\\nb\"");
    REQUIRE(inspect(std::string(1, '\x01')) == "\"\\x01\"");
}
