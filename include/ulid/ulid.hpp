#pragma once

// Umbrella header. The free generate() functions use the system clock,
// /dev/urandom and the Crockford codec; build a Generator to inject others.

#include <ulid/crockford.hpp>
#include <ulid/error.hpp>
#include <ulid/field.hpp>
#include <ulid/generator.hpp>
#include <ulid/result.hpp>
#include <ulid/source.hpp>
#include <ulid/transcode.hpp>
#include <ulid/validate.hpp>

namespace ulid {

Result<std::string> generate();
Result<std::string> generate(std::int64_t time);

} // namespace ulid
