#pragma once

#include "core/uuid.hpp"

namespace uuidpp {

// A UUID that may be absent, as opposed to present and equal to Nil.
// Storage adapters map an invalid NullUuid to their own absent marker.
struct NullUuid {
    Uuid uuid;
    bool valid = false;

    NullUuid() = default;
    NullUuid(const Uuid& value) : uuid(value), valid(true) {}

    bool has_value() const { return valid; }
};

inline bool operator==(const NullUuid& lhs, const NullUuid& rhs) {
    if (lhs.valid != rhs.valid) {
        return false;
    }
    return !lhs.valid || lhs.uuid == rhs.uuid;
}

inline bool operator!=(const NullUuid& lhs, const NullUuid& rhs) {
    return !(lhs == rhs);
}

} // namespace uuidpp
