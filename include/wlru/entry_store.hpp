#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace wlru {

/**
 * @class EntryStore
 * @brief Hash index from key to the handle of its entry.
 *
 * Pure lookup structure: no ordering, no ownership of entries. Not
 * thread-safe by itself.
 */
template <typename Key, typename Hash>
class EntryStore {
public:
    EntryStore() = default;

    /**
     * @brief Indexes a key under a handle.
     * @return false if the key is already present (nothing is changed).
     */
    bool Insert(const Key& key, Handle handle) {
        return index_.emplace(key, handle).second;
    }

    /**
     * @brief Points an indexed key at a new handle. Never allocates.
     * @return false if the key is absent.
     */
    bool Rebind(const Key& key, Handle handle) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        it->second = handle;
        return true;
    }

    std::optional<Handle> Lookup(const Key& key) const {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Drops a key from the index.
     * @return The handle it was stored under, or std::nullopt if absent.
     */
    std::optional<Handle> Remove(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        Handle handle = it->second;
        index_.erase(it);
        return handle;
    }

    bool Contains(const Key& key) const { return index_.count(key) != 0; }

    std::size_t Size() const { return index_.size(); }
    bool IsEmpty() const { return index_.empty(); }
    void Reserve(std::size_t n) { index_.reserve(n); }
    void Clear() { index_.clear(); }

private:
    std::unordered_map<Key, Handle, Hash> index_;
};

} // namespace wlru
