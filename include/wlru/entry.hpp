#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace wlru {

template <typename Key, typename Value>
struct Entry {
    Key key;
    Value value;
    Weight weight;
};

// Entries indexed by their recency handle. Mirrors the RecencyList arena:
// slot h is occupied exactly while handle h is linked.
template <typename Key, typename Value>
class EntrySlots {
public:
    using EntryType = Entry<Key, Value>;

    void Emplace(Handle handle, EntryType entry) {
        if (handle >= slots_.size()) {
            slots_.resize(static_cast<std::size_t>(handle) + 1);
        }
        if (slots_[handle].has_value()) {
            throw std::logic_error("EntrySlots: slot already occupied");
        }
        slots_[handle].emplace(std::move(entry));
        ++occupied_;
    }

    EntryType* Get(Handle handle) {
        if (handle >= slots_.size() || !slots_[handle].has_value()) {
            return nullptr;
        }
        return &*slots_[handle];
    }

    const EntryType* Get(Handle handle) const {
        if (handle >= slots_.size() || !slots_[handle].has_value()) {
            return nullptr;
        }
        return &*slots_[handle];
    }

    std::optional<EntryType> Take(Handle handle) {
        if (handle >= slots_.size() || !slots_[handle].has_value()) {
            return std::nullopt;
        }
        std::optional<EntryType> out(std::move(slots_[handle]));
        slots_[handle].reset();
        --occupied_;
        return out;
    }

    // Grows the table so Emplace() below @p n never allocates.
    void EnsureSize(std::size_t n) {
        if (slots_.size() < n) {
            slots_.resize(n);
        }
    }

    std::size_t Occupied() const { return occupied_; }
    void Reserve(std::size_t n) { slots_.reserve(n); }
    void Clear() {
        slots_.clear();
        occupied_ = 0;
    }

private:
    std::vector<std::optional<EntryType>> slots_;
    std::size_t occupied_ = 0;
};

} // namespace wlru
