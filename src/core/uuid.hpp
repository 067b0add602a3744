#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace uuidpp {

// UUID layout variants (RFC 4122 section 4.1.1)
enum class Variant : uint8_t {
    NCS = 0,
    RFC4122 = 1,
    Microsoft = 2,
    Future = 3
};

// Time embedded in a UUID, at one-second resolution. Seconds keep every
// 60-bit version 1 and 40-bit version 6 value in range.
using UuidTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

// DCE security domains used by version 2 UUIDs
enum class Domain : uint8_t {
    Person = 0,
    Group = 1,
    Org = 2
};

/**
 * @brief A 128-bit UUID stored as 16 bytes in network order.
 *
 * Plain value type: copyable, comparable byte by byte, no internal pointers.
 * A default-constructed Uuid is the Nil UUID (all bits zero).
 *
 * Binary layout (RFC 4122 section 4.1.2):
 *
 *    0  1  2  3 | 4  5 | 6  7 | 8  9 | 10 11 12 13 14 15
 *    time_low   | mid  | hi   | clk  | node
 */
class Uuid {
public:
    static constexpr size_t kSize = 16;
    using Bytes = std::array<uint8_t, kSize>;

    constexpr Uuid() : bytes_{} {}
    explicit constexpr Uuid(const Bytes& bytes) : bytes_(bytes) {}

    // Algorithm version, the high nibble of byte 6
    unsigned version() const { return bytes_[6] >> 4; }

    // Layout variant, classified from the top bits of byte 8
    Variant variant() const;

    void set_version(uint8_t version);

    // Writes the RFC 4122 variant pattern (10xxxxxx) into byte 8
    void set_variant();

    bool is_nil() const;
    bool equals(const Uuid& other) const;

    /**
     * @brief Returns the time embedded in the UUID.
     *
     * Version 1 carries 100-ns ticks since 1582-10-15, truncated here to whole
     * seconds (rounded toward the past); version 6 carries Unix seconds in its
     * first 40 bits. Every other version yields std::nullopt.
     */
    std::optional<UuidTime> time() const;

    const Bytes& bytes() const { return bytes_; }
    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }

    uint8_t& operator[](size_t index) { return bytes_[index]; }
    uint8_t operator[](size_t index) const { return bytes_[index]; }

private:
    Bytes bytes_;
};

// The Nil UUID
inline constexpr Uuid kNil{};

bool equal(const Uuid& lhs, const Uuid& rhs);

// Unsigned byte-wise three-way comparison: <0, 0 or >0
int compare(const Uuid& lhs, const Uuid& rhs);

Uuid bitwise_and(const Uuid& lhs, const Uuid& rhs);
Uuid bitwise_or(const Uuid& lhs, const Uuid& rhs);

inline bool operator==(const Uuid& lhs, const Uuid& rhs) { return equal(lhs, rhs); }
inline bool operator!=(const Uuid& lhs, const Uuid& rhs) { return !equal(lhs, rhs); }
inline bool operator<(const Uuid& lhs, const Uuid& rhs) { return compare(lhs, rhs) < 0; }
inline bool operator>(const Uuid& lhs, const Uuid& rhs) { return compare(lhs, rhs) > 0; }
inline bool operator<=(const Uuid& lhs, const Uuid& rhs) { return compare(lhs, rhs) <= 0; }
inline bool operator>=(const Uuid& lhs, const Uuid& rhs) { return compare(lhs, rhs) >= 0; }
inline Uuid operator&(const Uuid& lhs, const Uuid& rhs) { return bitwise_and(lhs, rhs); }
inline Uuid operator|(const Uuid& lhs, const Uuid& rhs) { return bitwise_or(lhs, rhs); }

// Binary codec: identity copy of the 16 bytes
std::vector<uint8_t> to_bytes(const Uuid& uuid);

// Throws LengthError unless size is exactly 16
Uuid from_bytes(const uint8_t* data, size_t size);
Uuid from_bytes(const std::vector<uint8_t>& data);

// Same as from_bytes, but returns the Nil UUID on a length mismatch
Uuid from_bytes_or_nil(const uint8_t* data, size_t size);
Uuid from_bytes_or_nil(const std::vector<uint8_t>& data);

} // namespace uuidpp

namespace std {

template <>
struct hash<uuidpp::Uuid> {
    size_t operator()(const uuidpp::Uuid& uuid) const noexcept;
};

} // namespace std
