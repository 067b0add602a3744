#include "core/uuid.hpp"
#include "core/errors.hpp"
#include "core/time_constants.hpp"

#include <algorithm>
#include <cstring>

namespace uuidpp {

Variant Uuid::variant() const {
    const uint8_t octet = bytes_[8];

    // 0xx
    if ((octet & 0x80) == 0x00) {
        return Variant::NCS;
    }
    // 10x
    if ((octet & 0xc0) == 0x80) {
        return Variant::RFC4122;
    }
    // 110
    if ((octet & 0xe0) == 0xc0) {
        return Variant::Microsoft;
    }
    // 111
    return Variant::Future;
}

void Uuid::set_version(uint8_t version) {
    bytes_[6] = static_cast<uint8_t>((bytes_[6] & 0x0f) | (version << 4));
}

void Uuid::set_variant() {
    bytes_[8] = static_cast<uint8_t>((bytes_[8] & 0xbf) | 0x80);
}

bool Uuid::is_nil() const {
    return equal(*this, kNil);
}

bool Uuid::equals(const Uuid& other) const {
    return equal(*this, other);
}

std::optional<UuidTime> Uuid::time() const {
    switch (version()) {
        case 1: {
            uint64_t ticks = 0;
            ticks |= static_cast<uint64_t>(bytes_[0]) << 24;
            ticks |= static_cast<uint64_t>(bytes_[1]) << 16;
            ticks |= static_cast<uint64_t>(bytes_[2]) << 8;
            ticks |= static_cast<uint64_t>(bytes_[3]);
            ticks |= static_cast<uint64_t>(bytes_[4]) << 40;
            ticks |= static_cast<uint64_t>(bytes_[5]) << 32;
            ticks |= static_cast<uint64_t>(bytes_[6] & 0x0f) << 56;
            ticks |= static_cast<uint64_t>(bytes_[7]) << 48;

            // 60 bits of ticks fit int64_t; the difference may be negative
            const UuidTicks since_unix(static_cast<int64_t>(ticks) -
                                       static_cast<int64_t>(kEpochOffsetTicks));
            return UuidTime(std::chrono::floor<std::chrono::seconds>(since_unix));
        }
        case 6: {
            uint64_t stamp = 0;
            for (size_t i = 0; i < 8; ++i) {
                stamp = (stamp << 8) | bytes_[i];
            }
            return UuidTime(std::chrono::seconds(static_cast<int64_t>(stamp >> 24)));
        }
        default:
            return std::nullopt;
    }
}

bool equal(const Uuid& lhs, const Uuid& rhs) {
    return lhs.bytes() == rhs.bytes();
}

int compare(const Uuid& lhs, const Uuid& rhs) {
    return std::memcmp(lhs.data(), rhs.data(), Uuid::kSize);
}

Uuid bitwise_and(const Uuid& lhs, const Uuid& rhs) {
    Uuid result;
    for (size_t i = 0; i < Uuid::kSize; ++i) {
        result[i] = lhs[i] & rhs[i];
    }
    return result;
}

Uuid bitwise_or(const Uuid& lhs, const Uuid& rhs) {
    Uuid result;
    for (size_t i = 0; i < Uuid::kSize; ++i) {
        result[i] = lhs[i] | rhs[i];
    }
    return result;
}

std::vector<uint8_t> to_bytes(const Uuid& uuid) {
    return std::vector<uint8_t>(uuid.bytes().begin(), uuid.bytes().end());
}

Uuid from_bytes(const uint8_t* data, size_t size) {
    if (size != Uuid::kSize) {
        throw LengthError(Uuid::kSize, size);
    }
    Uuid::Bytes bytes;
    std::copy(data, data + size, bytes.begin());
    return Uuid(bytes);
}

Uuid from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

Uuid from_bytes_or_nil(const uint8_t* data, size_t size) {
    if (size != Uuid::kSize) {
        return kNil;
    }
    return from_bytes(data, size);
}

Uuid from_bytes_or_nil(const std::vector<uint8_t>& data) {
    return from_bytes_or_nil(data.data(), data.size());
}

} // namespace uuidpp

size_t std::hash<uuidpp::Uuid>::operator()(const uuidpp::Uuid& uuid) const noexcept {
    // FNV-1a
    uint64_t fnv = 0xcbf29ce484222325ULL;
    for (uint8_t octet : uuid.bytes()) {
        fnv ^= octet;
        fnv *= 0x100000001b3ULL;
    }
    return static_cast<size_t>(fnv);
}
