#pragma once

#include <ulid/result.hpp>
#include <string>
#include <cstdio>

namespace ulid::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Destination for all log output; defaults to stderr. Passing nullptr
// restores the default. Colour auto-detection re-runs against the new stream.
void set_stream(std::FILE* stream);
std::FILE* get_stream();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Inverse of level_name(), case-insensitive. "warning" is accepted for Warn.
Result<Level> parse_level(const std::string& name);

} // namespace ulid::log
