#pragma once

#include <chrono>
#include <cstdint>
#include <ratio>

namespace uuidpp {

// 100-nanosecond intervals, the resolution of RFC 4122 timestamps
using UuidTicks = std::chrono::duration<int64_t, std::ratio<1, 10000000>>;

// Number of 100-ns intervals between the UUID epoch 1582-10-15 00:00:00
// and the Unix epoch 1970-01-01 00:00:00.
constexpr uint64_t kEpochOffsetTicks = 122192928000000000ULL;

} // namespace uuidpp
