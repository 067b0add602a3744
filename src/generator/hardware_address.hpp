#pragma once

#include <array>
#include <cstdint>
#include <optional>

namespace uuidpp {

// 48-bit IEEE 802 node address
using NodeAddress = std::array<uint8_t, 6>;

// Returns the hardware address of the first network interface that exposes a
// non-zero address of at least 6 bytes, or std::nullopt if there is none.
std::optional<NodeAddress> find_hardware_address();

} // namespace uuidpp
