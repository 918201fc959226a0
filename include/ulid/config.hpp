#pragma once

#include <ulid/log.hpp>
#include <ulid/result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ulid {

// Upper bound for [generate] count and for counts given on a command line.
constexpr int kMaxCount = 1000000;

// Layered configuration: global < local.
// A field only overrides a lower layer when it was set explicitly.
struct Config {
    log::Level log_level = log::Info;
    bool log_color = false;
    std::string random_device = "/dev/urandom";
    int count = 1;
    std::optional<std::int64_t> time;  // fixed timestamp for [generate]

    bool log_level_set = false;
    bool log_color_set = false;
    bool random_device_set = false;
    bool count_set = false;

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Load from a TOML file; errors carry the file path
    static Result<Config> load(const std::string& path);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push log_level and (if set) log_color into ulid::log.
    void apply_logging() const;
};

// Decimal count in 1..kMaxCount; anything else is InvalidArg.
Result<int> parse_count(const std::string& text);

// ~/.ulid/config.toml, or "" when no home directory is known.
std::string global_config_path();

} // namespace ulid
