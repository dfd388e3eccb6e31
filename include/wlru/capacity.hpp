#pragma once

#include "types.hpp"

namespace wlru {

// Running total of admitted weight against a fixed budget. Callers check
// WouldExceed() before Admit(); the accountant itself never refuses.
class CapacityAccountant {
public:
    explicit CapacityAccountant(Weight capacity);

    void Admit(Weight weight);
    void Release(Weight weight);

    bool WouldExceed(Weight weight) const;

    Weight Current() const { return current_; }
    Weight Capacity() const { return capacity_; }
    Weight Available() const;

    // Does not evict; the caller drains until Current() <= Capacity().
    void SetCapacity(Weight capacity);
    void Reset() { current_ = 0; }

private:
    Weight capacity_;
    Weight current_ = 0;
};

} // namespace wlru
