#include "wlru/hash.hpp"

#include <xxhash.h>

namespace wlru {

std::uint64_t HashBytes(const void* data, std::size_t len, std::uint64_t seed) {
    if (seed == 0) {
        return XXH3_64bits(data, len);
    }
    return XXH3_64bits_withSeed(data, len, seed);
}

} // namespace wlru
