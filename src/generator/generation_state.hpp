#pragma once

#include "generator/entropy.hpp"
#include "generator/hardware_address.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>

namespace uuidpp {

// Returns 100-ns ticks since the UUID epoch (1582-10-15)
using EpochClock = std::function<uint64_t()>;

// Looks up a real hardware address for the node field
using HardwareAddressLookup = std::function<std::optional<NodeAddress>()>;

// Reads the system clock as 100-ns ticks since the UUID epoch
uint64_t system_epoch_ticks();

// Values handed to one time-based generation call
struct TimeSnapshot {
    uint64_t timestamp = 0;
    uint16_t clock_sequence = 0;
    NodeAddress node{};
};

// Collaborators of a GenerationState. Empty members select the defaults.
struct GenerationStateOptions {
    std::shared_ptr<EntropySource> entropy;  // OpenSSL RAND_bytes
    EpochClock clock;                        // system_epoch_ticks
    HardwareAddressLookup hardware_lookup;   // find_hardware_address
};

/**
 * @brief Clock sequence, last timestamp and node address shared by the
 *        time-based generators.
 *
 * The state is seeded lazily, exactly once, on the first advance(): the clock
 * sequence comes from the entropy source and the node from the hardware
 * lookup, falling back to random bytes with the multicast bit set.
 *
 * Thread-safe: advance() is one critical section, so concurrent callers never
 * observe a partially updated state.
 */
class GenerationState {
public:
    explicit GenerationState(GenerationStateOptions options = {});

    // Non-copyable and non-movable
    GenerationState(const GenerationState&) = delete;
    GenerationState& operator=(const GenerationState&) = delete;
    GenerationState(GenerationState&&) = delete;
    GenerationState& operator=(GenerationState&&) = delete;

    // Process-wide instance backed by the default collaborators
    static GenerationState& instance();

    /**
     * @brief Reads the clock and advances the state.
     *
     * If the reading is not strictly greater than the previous one (same tick
     * or clock regression) the clock sequence is incremented first.
     */
    TimeSnapshot advance();

    EntropySource& entropy() const { return *entropy_; }

private:
    void initialize();

    std::shared_ptr<EntropySource> entropy_;
    EpochClock clock_;
    HardwareAddressLookup hardware_lookup_;

    std::once_flag init_flag_;
    std::mutex mutex_;  // Guards every member below

    uint16_t clock_sequence_ = 0;
    uint64_t last_time_ = 0;
    NodeAddress node_{};
};

} // namespace uuidpp
