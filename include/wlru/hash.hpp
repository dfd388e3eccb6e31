#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace wlru {

// XXH3-64 over a byte range.
std::uint64_t HashBytes(const void* data, std::size_t len, std::uint64_t seed = 0);

// Default key hasher for the cache. Falls back to std::hash; byte-like keys
// go through XXH3.
template <typename Key>
struct Hasher : std::hash<Key> {};

template <>
struct Hasher<std::string> {
    std::size_t operator()(const std::string& key) const {
        return static_cast<std::size_t>(HashBytes(key.data(), key.size()));
    }
};

template <>
struct Hasher<std::vector<std::uint8_t>> {
    std::size_t operator()(const std::vector<std::uint8_t>& key) const {
        return static_cast<std::size_t>(HashBytes(key.data(), key.size()));
    }
};

} // namespace wlru
