#pragma once

#include "capacity.hpp"
#include "entry.hpp"
#include "entry_store.hpp"
#include "evictor.hpp"
#include "hash.hpp"
#include "recency_list.hpp"
#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace wlru {

/**
 * @class WeightedLruCache
 * @brief Bounded key/value cache whose budget is the sum of entry weights.
 *
 * Every public member takes the cache mutex, including the read-only
 * looking ones: Get() reorders recency, so there are no pure readers.
 */
template <typename Key, typename Value, typename Hash = Hasher<Key>>
class WeightedLruCache {
    static_assert(std::is_nothrow_move_constructible<Key>::value,
                  "cache keys must be nothrow move constructible");
    static_assert(std::is_nothrow_move_constructible<Value>::value,
                  "cache values must be nothrow move constructible");

public:
    using EntryType = Entry<Key, Value>;
    using EvictionListener = std::function<void(const Key&, const Value&, Weight)>;

    /**
     * @throws InvalidCapacity if @p capacity <= 0.
     */
    explicit WeightedLruCache(std::int64_t capacity)
        : p_impl(std::make_unique<Impl>(ValidateCapacity(capacity))) {}

    explicit WeightedLruCache(const Config& cfg)
        : p_impl(std::make_unique<Impl>(ValidateCapacity(cfg.capacity))) {
        if (cfg.expected_entries > 0) {
            p_impl->store.Reserve(cfg.expected_entries);
            p_impl->order.Reserve(cfg.expected_entries);
            p_impl->slots.Reserve(cfg.expected_entries);
        }
    }

    ~WeightedLruCache() = default;

    /**
     * @brief Returns the value for @p key and marks it most recently used.
     * @return The value, or std::nullopt on a miss (no state is changed).
     */
    std::optional<Value> Get(const Key& key) {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        std::optional<Handle> handle = p_impl->store.Lookup(key);
        if (!handle) {
            ++p_impl->stats.misses;
            return std::nullopt;
        }
        p_impl->order.Promote(*handle);
        ++p_impl->stats.hits;
        return p_impl->slot(*handle).value;
    }

    /**
     * @brief Inserts or replaces @p key, evicting LRU entries as needed.
     *
     * Either the put completes or the cache is left untouched, including
     * any entry already stored under @p key: copying the key, growing the
     * index, the arena and the slot table all happen before the first
     * component changes.
     */
    PutResult Put(const Key& key, Value value, std::int64_t weight) {
        std::vector<EntryType> evicted;
        EvictionListener listener;
        {
            std::lock_guard<std::mutex> lock(p_impl->mutex);
            Impl& impl = *p_impl;
            if (weight <= 0) {
                ++impl.stats.rejections;
                return PutResult::kInvalidWeight;
            }
            const Weight w = static_cast<Weight>(weight);
            if (w > impl.accountant.Capacity()) {
                ++impl.stats.rejections;
                return PutResult::kWeightExceedsCapacity;
            }

            EntryType fresh{key, std::move(value), w};
            const std::optional<Handle> existing = impl.store.Lookup(key);
            impl.order.ReserveOne();
            impl.slots.EnsureSize(impl.order.ArenaSize() + 1);
            if (impl.listener) {
                evicted.reserve(impl.evictor.CountVictims(w, impl.accountant.Capacity(), existing));
            }
            if (!existing && !impl.store.Insert(key, RecencyList::kNil)) {
                throw InvariantViolation("key indexed after a failed lookup");
            }

            // Nothing below allocates or copies a key.
            if (existing) {
                std::optional<EntryType> old = impl.slots.Take(*existing);
                if (!old) {
                    throw InvariantViolation("indexed handle " + std::to_string(*existing) + " has no entry");
                }
                impl.order.Remove(*existing);
                impl.accountant.Release(old->weight);
            }

            std::vector<EntryType>* sink = impl.listener ? &evicted : nullptr;
            const std::size_t before = impl.evictor.Evictions();
            const bool fits = impl.evictor.MakeRoom(w, sink);
            impl.stats.evictions += impl.evictor.Evictions() - before;
            if (!fits) {
                impl.store.Remove(key);
                return PutResult::kWeightExceedsCapacity;
            }

            Handle handle = impl.order.PushMostRecent();
            impl.slots.Emplace(handle, std::move(fresh));
            impl.store.Rebind(key, handle);
            impl.accountant.Admit(w);

            if (existing) {
                ++impl.stats.updates;
            } else {
                ++impl.stats.insertions;
            }
            if (!evicted.empty()) {
                listener = impl.listener;
            }
        }
        Notify(listener, evicted);
        return PutResult::kOk;
    }

    /**
     * @return true if @p key was present and has been removed.
     */
    bool Remove(const Key& key) {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        if (!p_impl->drop(key)) {
            return false;
        }
        ++p_impl->stats.removals;
        return true;
    }

    // Total weight of the stored entries.
    Weight Size() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        return p_impl->accountant.Current();
    }

    // Number of stored entries.
    std::size_t Len() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        return p_impl->store.Size();
    }

    bool IsEmpty() const { return Len() == 0; }

    Weight Capacity() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        return p_impl->accountant.Capacity();
    }

    /**
     * @brief Changes the weight budget. Shrinking evicts LRU entries until
     * the stored weight fits again.
     * @throws InvalidCapacity if @p capacity <= 0.
     */
    void SetCapacity(std::int64_t capacity) {
        const Weight cap = ValidateCapacity(capacity);
        std::vector<EntryType> evicted;
        EvictionListener listener;
        {
            std::lock_guard<std::mutex> lock(p_impl->mutex);
            if (p_impl->listener) {
                evicted.reserve(p_impl->evictor.CountVictims(0, cap));
            }
            p_impl->accountant.SetCapacity(cap);
            std::vector<EntryType>* sink = p_impl->listener ? &evicted : nullptr;
            const std::size_t before = p_impl->evictor.Evictions();
            p_impl->evictor.Drain(sink);
            p_impl->stats.evictions += p_impl->evictor.Evictions() - before;
            if (!evicted.empty()) {
                listener = p_impl->listener;
            }
        }
        Notify(listener, evicted);
    }

    // Membership test without promotion.
    bool Contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        return p_impl->store.Contains(key);
    }

    // Value lookup without promotion and without touching the statistics.
    std::optional<Value> Peek(const Key& key) const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        std::optional<Handle> handle = p_impl->store.Lookup(key);
        if (!handle) {
            return std::nullopt;
        }
        return p_impl->slot(*handle).value;
    }

    std::optional<Weight> WeightOf(const Key& key) const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        std::optional<Handle> handle = p_impl->store.Lookup(key);
        if (!handle) {
            return std::nullopt;
        }
        return p_impl->slot(*handle).weight;
    }

    // Keys from least to most recently used.
    std::vector<Key> KeysByRecency() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        std::vector<Key> keys;
        keys.reserve(p_impl->order.Size());
        for (std::optional<Handle> h = p_impl->order.LeastRecent(); h; h = p_impl->order.Newer(*h)) {
            keys.push_back(p_impl->slot(*h).key);
        }
        return keys;
    }

    void Clear() {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        p_impl->store.Clear();
        p_impl->order.Clear();
        p_impl->slots.Clear();
        p_impl->accountant.Reset();
    }

    CacheStats Stats() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        return p_impl->stats;
    }

    void ResetStats() {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        p_impl->stats = CacheStats{};
    }

    /**
     * @brief Registers a callback run once per evicted entry, LRU first,
     * after the lock is released.
     *
     * The eviction is already committed when the listener runs. If it
     * throws, the exception propagates out of the Put() or SetCapacity()
     * that triggered it and the remaining evicted entries are not reported.
     */
    void SetEvictionListener(EvictionListener listener) {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        p_impl->listener = std::move(listener);
    }

    /**
     * @brief Verifies the structural invariants of the cache.
     * @throws InvariantViolation describing the first broken invariant.
     */
    void CheckInvariants() const {
        std::lock_guard<std::mutex> lock(p_impl->mutex);
        const Impl& impl = *p_impl;

        if (impl.accountant.Capacity() == 0) {
            throw InvariantViolation("capacity is zero");
        }
        if (impl.store.Size() != impl.order.Size() || impl.slots.Occupied() != impl.order.Size()) {
            throw InvariantViolation("index holds " + std::to_string(impl.store.Size()) +
                                     " keys but recency order holds " +
                                     std::to_string(impl.order.Size()) + " handles");
        }

        Weight total = 0;
        std::size_t walked = 0;
        for (std::optional<Handle> h = impl.order.LeastRecent(); h; h = impl.order.Newer(*h)) {
            const EntryType* entry = impl.slots.Get(*h);
            if (entry == nullptr) {
                throw InvariantViolation("linked handle " + std::to_string(*h) + " has no entry");
            }
            std::optional<Handle> indexed = impl.store.Lookup(entry->key);
            if (!indexed || *indexed != *h) {
                throw InvariantViolation("handle " + std::to_string(*h) + " is not indexed by its key");
            }
            if (entry->weight == 0) {
                throw InvariantViolation("entry with zero weight");
            }
            total += entry->weight;
            if (++walked > impl.order.Size()) {
                throw InvariantViolation("recency order contains a cycle");
            }
        }
        if (walked != impl.order.Size()) {
            throw InvariantViolation("recency order is shorter than its size");
        }
        if (total != impl.accountant.Current()) {
            throw InvariantViolation("accounted weight " + std::to_string(impl.accountant.Current()) +
                                     " differs from stored weight " + std::to_string(total));
        }
        if (total > impl.accountant.Capacity()) {
            throw InvariantViolation("stored weight exceeds capacity");
        }
    }

private:
    struct Impl {
        explicit Impl(Weight capacity)
            : accountant(capacity), evictor(store, order, slots, accountant) {}

        const EntryType& slot(Handle handle) const {
            const EntryType* entry = slots.Get(handle);
            if (entry == nullptr) {
                throw InvariantViolation("indexed handle " + std::to_string(handle) + " has no entry");
            }
            return *entry;
        }

        // Removes key from every component. Assumes the lock is held.
        bool drop(const Key& key) {
            std::optional<Handle> handle = store.Remove(key);
            if (!handle) {
                return false;
            }
            std::optional<EntryType> entry = slots.Take(*handle);
            if (!entry) {
                throw InvariantViolation("indexed handle " + std::to_string(*handle) + " has no entry");
            }
            order.Remove(*handle);
            accountant.Release(entry->weight);
            return true;
        }

        mutable std::mutex mutex;
        EntryStore<Key, Hash> store;
        RecencyList order;
        EntrySlots<Key, Value> slots;
        CapacityAccountant accountant;
        Evictor<Key, Value, Hash> evictor;
        CacheStats stats;
        EvictionListener listener;
    };

    static Weight ValidateCapacity(std::int64_t capacity) {
        if (capacity <= 0) {
            throw InvalidCapacity("capacity must be positive, got " + std::to_string(capacity));
        }
        return static_cast<Weight>(capacity);
    }

    static void Notify(const EvictionListener& listener, const std::vector<EntryType>& evicted) {
        if (!listener) {
            return;
        }
        for (const EntryType& entry : evicted) {
            listener(entry.key, entry.value, entry.weight);
        }
    }

    std::unique_ptr<Impl> p_impl;

    // Disable copy/move
    WeightedLruCache(const WeightedLruCache&) = delete;
    WeightedLruCache& operator=(const WeightedLruCache&) = delete;
    WeightedLruCache(WeightedLruCache&&) = delete;
    WeightedLruCache& operator=(WeightedLruCache&&) = delete;
};

} // namespace wlru
