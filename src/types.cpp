#include "wlru/types.hpp"

namespace wlru {

const char* ToString(PutResult result) {
    switch (result) {
        case PutResult::kOk:
            return "ok";
        case PutResult::kInvalidWeight:
            return "invalid_weight";
        case PutResult::kWeightExceedsCapacity:
            return "weight_exceeds_capacity";
    }
    return "unknown";
}

} // namespace wlru
