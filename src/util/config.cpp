#include <ulid/config.hpp>
#include <ulid/validate.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace ulid {

static UlidError type_error(const std::string& key, const char* expected) {
    return UlidError{UlidError::Config,
        "config key '" + key + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return UlidError{UlidError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto logt = doc["log"].as_table()) {
        if (auto node = logt->get("level")) {
            auto s = node->value<std::string>();
            if (!s) return type_error("log.level", "a string");
            auto lvl = log::parse_level(*s);
            ULID_TRY(lvl);
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto node = logt->get("color")) {
            auto b = node->value<bool>();
            if (!b) return type_error("log.color", "a boolean");
            cfg.log_color = *b;
            cfg.log_color_set = true;
        }
    }

    // [random] section
    if (auto rnd = doc["random"].as_table()) {
        if (auto node = rnd->get("device")) {
            auto s = node->value<std::string>();
            if (!s || s->empty()) return type_error("random.device", "a non-empty string");
            cfg.random_device = *s;
            cfg.random_device_set = true;
        }
    }

    // [generate] section
    if (auto gen = doc["generate"].as_table()) {
        if (auto node = gen->get("count")) {
            auto n = node->value<int64_t>();
            if (!n) return type_error("generate.count", "an integer");
            if (*n < 1 || *n > kMaxCount) {
                return UlidError{UlidError::Config,
                    "config key 'generate.count' out of range: " + std::to_string(*n),
                    "count must be between 1 and " + std::to_string(kMaxCount)};
            }
            cfg.count = static_cast<int>(*n);
            cfg.count_set = true;
        }
        if (auto node = gen->get("time")) {
            // Accept either an integer or a string; strings go through the
            // same integer check as any textual timestamp.
            if (auto n = node->value_exact<int64_t>()) {
                cfg.time = *n;
            } else if (auto s = node->value_exact<std::string>()) {
                auto t = parse_time(*s);
                ULID_TRY(t);
                cfg.time = t.value();
            } else {
                return UlidError{UlidError::InvalidTimeType,
                    "config key 'generate.time' must be an integer millisecond timestamp"};
            }
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<int> parse_count(const std::string& text) {
    UlidError bad{UlidError::InvalidArg,
        "count must be an integer between 1 and " + std::to_string(kMaxCount) +
            ", got " + inspect(text)};
    if (text.empty()) return bad;
    for (char c : text) {
        if (c < '0' || c > '9') return bad;
    }
    // Anything longer than kMaxCount's digits is out of range; no overflow below.
    if (text.size() > std::to_string(kMaxCount).size()) return bad;
    long n = std::stol(text);
    if (n < 1 || n > kMaxCount) return bad;
    return Result<int>::ok(static_cast<int>(n));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return UlidError{UlidError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto r = Config::parse(ss.str());
    if (r.is_err()) {
        r.error().file = path;
        return r;
    }
    log::debug("loaded config %s", path.c_str());
    return r;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.random_device_set) {
        random_device = other.random_device;
        random_device_set = true;
    }
    if (other.count_set) {
        count = other.count;
        count_set = true;
    }
    if (other.time.has_value()) {
        time = other.time;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (log_color_set) log::set_color_enabled(log_color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.ulid/config.toml";
}

} // namespace ulid
