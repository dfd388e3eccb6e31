#pragma once

#include "types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace wlru {

/**
 * @class RecencyList
 * @brief Orders handles from least to most recently used.
 *
 * Nodes live in a growable arena addressed by stable indices. Removed nodes
 * go on a free list and their indices are handed out again by later pushes,
 * so a handle stays valid exactly as long as its node is linked.
 *
 * This class is not thread-safe by itself. External synchronization (e.g., a std::mutex)
 * is required if it's accessed from multiple threads.
 *
 * The head of the list is the Least Recently Used (LRU) node, and the tail
 * is the Most Recently Used (MRU) node.
 */
class RecencyList {
public:
    static constexpr Handle kNil = static_cast<Handle>(-1);

    RecencyList() = default;

    /**
     * @brief Allocates a node and links it at the MRU end.
     * @return The handle of the new node.
     */
    Handle PushMostRecent();

    /**
     * @brief Moves a linked node to the MRU end.
     * @param handle A handle previously returned by PushMostRecent().
     */
    void Promote(Handle handle);

    /**
     * @brief Unlinks and frees the LRU node.
     * @return Its handle, or std::nullopt if the list is empty.
     */
    std::optional<Handle> PopLeastRecent();

    /**
     * @brief Unlinks and frees a node at any position.
     * @param handle A linked handle.
     */
    void Remove(Handle handle);

    std::optional<Handle> LeastRecent() const;
    std::optional<Handle> MostRecent() const;

    // Neighbour towards the LRU / MRU end, or std::nullopt at the boundary.
    std::optional<Handle> Older(Handle handle) const;
    std::optional<Handle> Newer(Handle handle) const;

    bool Contains(Handle handle) const;
    bool IsEmpty() const { return size_ == 0; }
    std::size_t Size() const { return size_; }

    // Arena slots ever allocated / slots waiting on the free list.
    std::size_t ArenaSize() const { return nodes_.size(); }
    std::size_t FreeCount() const { return nodes_.size() - size_; }

    void Reserve(std::size_t n) { nodes_.reserve(n); }

    // Makes the next PushMostRecent() nothrow.
    void ReserveOne();
    void Clear();

private:
    struct Node {
        Handle prev = kNil;
        Handle next = kNil;  // doubles as the free-list link when unused
        bool linked = false;
    };

    Handle allocate();
    void release(Handle handle);
    void link_back(Handle handle);
    void unlink(Handle handle);
    const Node& checked(Handle handle) const;

    std::vector<Node> nodes_;
    Handle head_ = kNil;  // LRU
    Handle tail_ = kNil;  // MRU
    Handle free_head_ = kNil;
    std::size_t size_ = 0;
};

} // namespace wlru
