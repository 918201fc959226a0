// demo_ulid.cpp
//
// A small standalone program that exercises the ULID generator, the
// binary/text transcoder, the TOML config and the logger. Run it with:
//
//     ./demo_ulid generate [count]          # fresh ULIDs (or at [generate] time)
//     ./demo_ulid encode 01563DF3648101...  # 32 hex chars -> ULID
//     ./demo_ulid decode 01ARYZ6S41...      # ULID -> time + randomness field
//     ./demo_ulid binary 01ARYZ6S41...      # ULID -> hex bytes
//
// Configuration is read from ~/.ulid/config.toml, then ./ulid.toml on top.
// Errors are printed to stderr in their formatted form.

#include <ulid/config.hpp>
#include <ulid/log.hpp>
#include <ulid/ulid.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ulid;

static const char* kUsage =
    "usage: demo_ulid generate [count] | encode <hex32> | decode <ulid> | binary <ulid>";

// Missing files are skipped; unreadable or invalid ones are errors.
static Result<std::optional<Config>> load_layer(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        log::trace("no config at %s", path.empty() ? "(no home)" : path.c_str());
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    ULID_TRY(cfg);
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static Result<Config> load_config() {
    auto global = load_layer(global_config_path());
    ULID_TRY(global);
    auto local = load_layer("ulid.toml");
    ULID_TRY(local);
    return Result<Config>::ok(Config::effective(global.value(), local.value()));
}

static Result<Bytes16> parse_hex16(const std::string& hex) {
    if (hex.size() != 2 * kUlidBytes) {
        return UlidError{UlidError::InvalidArg,
            "expected 32 hex characters, got " + inspect(hex)};
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    Bytes16 out{};
    for (size_t i = 0; i < kUlidBytes; ++i) {
        int hi = nibble(hex[2 * i]);
        int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return UlidError{UlidError::InvalidArg,
                "invalid hex digit in " + inspect(hex),
                "at position " + std::to_string(hi < 0 ? 2 * i : 2 * i + 1)};
        }
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<Bytes16>::ok(out);
}

static Status run_generate(const Config& cfg, int argc, char** argv) {
    int count = cfg.count;
    if (argc > 2) {
        auto n = parse_count(argv[2]);
        ULID_TRY(n);
        count = n.value();
    }

    SystemClock clock;
    UrandomSource random(cfg.random_device);
    Generator gen(clock, random);
    log::debug("generating %d ULID(s) from %s", count, random.device().c_str());

    for (int i = 0; i < count; ++i) {
        auto id = cfg.time ? gen.generate(*cfg.time) : gen.generate();
        ULID_TRY(id);
        std::cout << id.value() << "\n";
    }
    return ok_status();
}

static Status run(const Config& cfg, int argc, char** argv) {
    if (argc < 2) {
        return UlidError{UlidError::InvalidArg, "no command given", kUsage};
    }
    std::string cmd = argv[1];
    if (cmd == "generate") {
        return run_generate(cfg, argc, argv);
    }
    if (argc < 3) {
        return UlidError{UlidError::InvalidArg,
            "command '" + cmd + "' needs an argument", kUsage};
    }
    std::string arg = argv[2];

    if (cmd == "encode") {
        auto bytes = parse_hex16(arg);
        ULID_TRY(bytes);
        auto text = encode(bytes.value());
        ULID_TRY(text);
        std::cout << text.value() << "\n";
    } else if (cmd == "decode") {
        auto d = decode(arg);
        ULID_TRY(d);
        std::cout << "time:       " << d.value().time << "\n"
                  << "randomness: " << d.value().randomness << "\n";
    } else if (cmd == "binary") {
        auto bytes = to_binary(arg);
        ULID_TRY(bytes);
        std::cout << to_hex(bytes.value()) << "\n";
    } else {
        return UlidError{UlidError::InvalidArg, "unknown command '" + cmd + "'", kUsage};
    }
    return ok_status();
}

int main(int argc, char** argv) {
    auto cfg = load_config();
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }
    cfg.value().apply_logging();
    log::trace("demo starting, argc = %d", argc);

    auto status = run(cfg.value(), argc, argv);
    if (status.is_err()) {
        log::error("%s failed", argc > 1 ? argv[1] : "demo_ulid");
        std::cerr << status.error().format() << "\n";
        return 1;
    }
    return 0;
}
