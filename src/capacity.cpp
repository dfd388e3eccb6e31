#include "wlru/capacity.hpp"

namespace wlru {

CapacityAccountant::CapacityAccountant(Weight capacity) : capacity_(capacity) {}

void CapacityAccountant::Admit(Weight weight) {
    current_ += weight;
}

void CapacityAccountant::Release(Weight weight) {
    current_ -= weight;
}

bool CapacityAccountant::WouldExceed(Weight weight) const {
    // Written as a subtraction so current_ + weight cannot wrap.
    if (current_ > capacity_) return true;
    return weight > capacity_ - current_;
}

Weight CapacityAccountant::Available() const {
    return current_ >= capacity_ ? 0 : capacity_ - current_;
}

void CapacityAccountant::SetCapacity(Weight capacity) {
    capacity_ = capacity;
}

} // namespace wlru
