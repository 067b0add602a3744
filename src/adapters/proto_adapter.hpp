#pragma once

#include "core/null_uuid.hpp"
#include "core/uuid.hpp"
#include "uuidpp.pb.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace uuidpp {

// Marshaling contract expected by protobuf custom-type plumbing

// Always 16
size_t marshal_size(const Uuid& uuid);

// Copies the 16 bytes into data and returns 16. Throws LengthError if
// capacity is smaller than 16.
size_t marshal_to(const Uuid& uuid, uint8_t* data, size_t capacity);

// Throws LengthError unless size is exactly 16
Uuid unmarshal(const uint8_t* data, size_t size);

// Generated message conversions
wire::Uuid to_proto(const Uuid& uuid);
Uuid from_proto(const wire::Uuid& message);

wire::NullableUuid to_proto(const NullUuid& value);
NullUuid from_proto(const wire::NullableUuid& message);

wire::UuidList to_proto(const std::vector<Uuid>& uuids);
std::vector<Uuid> from_proto(const wire::UuidList& message);

} // namespace uuidpp
