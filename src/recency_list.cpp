#include "wlru/recency_list.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace wlru {

Handle RecencyList::PushMostRecent() {
    Handle handle = allocate();
    link_back(handle);
    ++size_;
    return handle;
}

void RecencyList::Promote(Handle handle) {
    checked(handle);
    if (handle == tail_) {
        return;
    }
    unlink(handle);
    link_back(handle);
}

std::optional<Handle> RecencyList::PopLeastRecent() {
    if (head_ == kNil) {
        return std::nullopt;
    }
    Handle handle = head_;
    Remove(handle);
    return handle;
}

void RecencyList::Remove(Handle handle) {
    checked(handle);
    unlink(handle);
    release(handle);
    --size_;
}

std::optional<Handle> RecencyList::LeastRecent() const {
    if (head_ == kNil) return std::nullopt;
    return head_;
}

std::optional<Handle> RecencyList::MostRecent() const {
    if (tail_ == kNil) return std::nullopt;
    return tail_;
}

std::optional<Handle> RecencyList::Older(Handle handle) const {
    Handle prev = checked(handle).prev;
    if (prev == kNil) return std::nullopt;
    return prev;
}

std::optional<Handle> RecencyList::Newer(Handle handle) const {
    Handle next = checked(handle).next;
    if (next == kNil) return std::nullopt;
    return next;
}

bool RecencyList::Contains(Handle handle) const {
    return handle < nodes_.size() && nodes_[handle].linked;
}

void RecencyList::ReserveOne() {
    if (free_head_ != kNil || nodes_.size() < nodes_.capacity()) {
        return;
    }
    if (nodes_.size() >= static_cast<std::size_t>(kNil)) {
        throw std::length_error("RecencyList arena exhausted");
    }
    nodes_.reserve(std::max<std::size_t>(8, nodes_.size() * 2));
}

void RecencyList::Clear() {
    nodes_.clear();
    head_ = kNil;
    tail_ = kNil;
    free_head_ = kNil;
    size_ = 0;
}

Handle RecencyList::allocate() {
    if (free_head_ != kNil) {
        Handle handle = free_head_;
        free_head_ = nodes_[handle].next;
        nodes_[handle] = Node{};
        return handle;
    }
    if (nodes_.size() >= static_cast<std::size_t>(kNil)) {
        throw std::length_error("RecencyList arena exhausted");
    }
    nodes_.emplace_back();
    return static_cast<Handle>(nodes_.size() - 1);
}

void RecencyList::release(Handle handle) {
    Node& node = nodes_[handle];
    node.linked = false;
    node.prev = kNil;
    node.next = free_head_;
    free_head_ = handle;
}

void RecencyList::link_back(Handle handle) {
    Node& node = nodes_[handle];
    node.prev = tail_;
    node.next = kNil;
    node.linked = true;
    if (tail_ != kNil) {
        nodes_[tail_].next = handle;
    } else {
        head_ = handle;
    }
    tail_ = handle;
}

void RecencyList::unlink(Handle handle) {
    Node& node = nodes_[handle];
    if (node.prev != kNil) {
        nodes_[node.prev].next = node.next;
    } else {
        head_ = node.next;
    }
    if (node.next != kNil) {
        nodes_[node.next].prev = node.prev;
    } else {
        tail_ = node.prev;
    }
    node.prev = kNil;
    node.next = kNil;
}

const RecencyList::Node& RecencyList::checked(Handle handle) const {
    if (!Contains(handle)) {
        throw std::out_of_range("RecencyList: handle " + std::to_string(handle) + " is not linked");
    }
    return nodes_[handle];
}

} // namespace wlru
