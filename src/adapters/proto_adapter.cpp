#include "adapters/proto_adapter.hpp"
#include "core/errors.hpp"

#include <algorithm>

namespace uuidpp {

size_t marshal_size(const Uuid&) {
    return Uuid::kSize;
}

size_t marshal_to(const Uuid& uuid, uint8_t* data, size_t capacity) {
    if (capacity < Uuid::kSize) {
        throw LengthError(Uuid::kSize, capacity);
    }
    std::copy(uuid.bytes().begin(), uuid.bytes().end(), data);
    return Uuid::kSize;
}

Uuid unmarshal(const uint8_t* data, size_t size) {
    return from_bytes(data, size);
}

wire::Uuid to_proto(const Uuid& uuid) {
    wire::Uuid message;
    message.set_value(reinterpret_cast<const char*>(uuid.data()), Uuid::kSize);
    return message;
}

Uuid from_proto(const wire::Uuid& message) {
    const std::string& value = message.value();
    return unmarshal(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

wire::NullableUuid to_proto(const NullUuid& value) {
    wire::NullableUuid message;
    if (value.valid) {
        *message.mutable_uuid() = to_proto(value.uuid);
    }
    return message;
}

NullUuid from_proto(const wire::NullableUuid& message) {
    if (!message.has_uuid()) {
        return NullUuid();
    }
    return NullUuid(from_proto(message.uuid()));
}

wire::UuidList to_proto(const std::vector<Uuid>& uuids) {
    wire::UuidList message;
    for (const auto& uuid : uuids) {
        *message.add_uuids() = to_proto(uuid);
    }
    return message;
}

std::vector<Uuid> from_proto(const wire::UuidList& message) {
    std::vector<Uuid> uuids;
    uuids.reserve(message.uuids_size());
    for (const auto& item : message.uuids()) {
        uuids.push_back(from_proto(item));
    }
    return uuids;
}

} // namespace uuidpp
