#pragma once

#include "capacity.hpp"
#include "entry.hpp"
#include "entry_store.hpp"
#include "recency_list.hpp"
#include "types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace wlru {

/**
 * @class Evictor
 * @brief Frees weight by dropping entries strictly in LRU order.
 *
 * Operates on the components owned by the cache; holds references only.
 * Assumes the caller holds the cache lock.
 */
template <typename Key, typename Value, typename Hash>
class Evictor {
public:
    using EntryType = Entry<Key, Value>;

    Evictor(EntryStore<Key, Hash>& store,
            RecencyList& order,
            EntrySlots<Key, Value>& slots,
            CapacityAccountant& accountant)
        : store_(store), order_(order), slots_(slots), accountant_(accountant) {}

    /**
     * @brief Evicts the shortest LRU prefix that lets @p for_weight fit.
     * @param for_weight Weight about to be admitted.
     * @param evicted If non-null, receives the evicted entries, LRU first.
     *        Reserve CountVictims() elements beforehand to keep this nothrow.
     * @return false if the cache drained and @p for_weight still does not fit.
     */
    bool MakeRoom(Weight for_weight, std::vector<EntryType>* evicted) {
        while (accountant_.WouldExceed(for_weight)) {
            if (!EvictOne(evicted)) {
                return false;
            }
        }
        return true;
    }

    // Evicts until the accountant is back within capacity (after a shrink).
    void Drain(std::vector<EntryType>* evicted) {
        MakeRoom(0, evicted);
    }

    /**
     * @brief Number of entries MakeRoom() would evict, without evicting.
     * @param skip A handle that will be dropped before eviction starts; its
     *        weight is discounted and it is never counted as a victim.
     */
    std::size_t CountVictims(Weight for_weight, Weight capacity,
                             std::optional<Handle> skip = std::nullopt) const {
        Weight current = accountant_.Current();
        if (skip) {
            current -= weight_of(*skip);
        }
        std::size_t count = 0;
        for (std::optional<Handle> h = order_.LeastRecent(); h; h = order_.Newer(*h)) {
            if (current <= capacity && for_weight <= capacity - current) {
                break;
            }
            if (skip && *h == *skip) {
                continue;
            }
            current -= weight_of(*h);
            ++count;
        }
        return count;
    }

    // Running count, never reset.
    std::size_t Evictions() const { return evictions_; }

private:
    // Entry moves are nothrow, and the victim leaves every component before
    // it is handed to the caller.
    bool EvictOne(std::vector<EntryType>* evicted) {
        std::optional<Handle> victim = order_.LeastRecent();
        if (!victim) {
            return false;
        }
        std::optional<EntryType> entry = slots_.Take(*victim);
        if (!entry) {
            throw InvariantViolation("evicted handle has no entry");
        }
        order_.Remove(*victim);
        if (!store_.Remove(entry->key)) {
            throw InvariantViolation("evicted entry missing from the index");
        }
        accountant_.Release(entry->weight);
        ++evictions_;
        if (evicted) {
            evicted->push_back(std::move(*entry));
        }
        return true;
    }

    Weight weight_of(Handle handle) const {
        const EntryType* entry = slots_.Get(handle);
        if (entry == nullptr) {
            throw InvariantViolation("linked handle " + std::to_string(handle) + " has no entry");
        }
        return entry->weight;
    }

    EntryStore<Key, Hash>& store_;
    RecencyList& order_;
    EntrySlots<Key, Value>& slots_;
    CapacityAccountant& accountant_;
    std::size_t evictions_ = 0;
};

} // namespace wlru
