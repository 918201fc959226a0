#include <ulid/ulid.hpp>

namespace ulid {

Result<std::string> generate() {
    Generator gen;
    return gen.generate();
}

Result<std::string> generate(std::int64_t time) {
    Generator gen;
    return gen.generate(time);
}

} // namespace ulid
