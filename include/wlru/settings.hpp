#pragma once

#include "types.hpp"

#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>

namespace wlru {

namespace settings_defaults {
    constexpr std::int64_t kCapacity = 64ll * 1024 * 1024; // 64 MiB of weight
    constexpr std::size_t kExpectedEntries = 0;
}

// Unset, empty, negative, out-of-range or malformed values yield defaultValue.
inline std::uint64_t GetEnvUint(const char* name, std::uint64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    while (std::isspace(static_cast<unsigned char>(*value))) ++value;
    if (*value == '\0' || *value == '-' || *value == '+') return defaultValue;
    char* end = nullptr;
    errno = 0;
    unsigned long long parsed = std::strtoull(value, &end, 10);
    if (errno == ERANGE || end == value || *end != '\0') return defaultValue;
    return static_cast<std::uint64_t>(parsed);
}

inline void ApplyConfigDefaults(Config& cfg) {
    constexpr std::uint64_t kMaxCapacity = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (cfg.capacity <= 0) {
        std::uint64_t capacity = GetEnvUint("WLRU_CAPACITY", static_cast<std::uint64_t>(settings_defaults::kCapacity));
        if (capacity > kMaxCapacity) capacity = static_cast<std::uint64_t>(settings_defaults::kCapacity);
        cfg.capacity = static_cast<std::int64_t>(capacity);
    }
    if (cfg.expected_entries == 0)
        cfg.expected_entries = static_cast<std::size_t>(
            GetEnvUint("WLRU_EXPECTED_ENTRIES", settings_defaults::kExpectedEntries));
}

} // namespace wlru
