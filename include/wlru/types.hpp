#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace wlru {

using Weight = std::uint64_t;

// Position of an entry in the recency arena. Plain index, carries no ownership.
using Handle = std::uint32_t;

struct Config {
    std::int64_t capacity = 0;        // 0: unset, see ApplyConfigDefaults()
    std::size_t expected_entries = 0; // reservation hint for the index and arena
};

enum class PutResult {
    kOk,
    kInvalidWeight,
    kWeightExceedsCapacity,
};

const char* ToString(PutResult result);

struct CacheStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t insertions = 0;
    std::uint64_t updates = 0;
    std::uint64_t evictions = 0;
    std::uint64_t removals = 0;
    std::uint64_t rejections = 0;
};

class InvalidCapacity : public std::invalid_argument {
public:
    explicit InvalidCapacity(const std::string& what) : std::invalid_argument(what) {}
};

// Raised when one of the cache's structural invariants no longer holds.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace wlru
