#include "generator/generation_state.hpp"
#include "core/time_constants.hpp"
#include "utils/logger.hpp"

#include <chrono>
#include <cstdio>
#include <string>

namespace uuidpp {

namespace {

std::string format_node(const NodeAddress& node) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
                  node[0], node[1], node[2], node[3], node[4], node[5]);
    return buf;
}

} // anonymous namespace

uint64_t system_epoch_ticks() {
    auto since_unix = std::chrono::duration_cast<UuidTicks>(
        std::chrono::system_clock::now().time_since_epoch());
    return kEpochOffsetTicks + static_cast<uint64_t>(since_unix.count());
}

GenerationState::GenerationState(GenerationStateOptions options)
    : entropy_(options.entropy ? std::move(options.entropy) : default_entropy_source()),
      clock_(options.clock ? std::move(options.clock) : EpochClock(system_epoch_ticks)),
      hardware_lookup_(options.hardware_lookup ? std::move(options.hardware_lookup)
                                               : HardwareAddressLookup(find_hardware_address)) {}

GenerationState& GenerationState::instance() {
    static GenerationState state;
    return state;
}

void GenerationState::initialize() {
    // Collaborators run outside mutex_; call_once already serializes them
    uint8_t seq[2];
    secure_random(*entropy_, seq, sizeof(seq));

    NodeAddress node{};
    const std::optional<NodeAddress> hardware = hardware_lookup_();
    if (hardware) {
        node = *hardware;
    } else {
        // Random node with the multicast bit set (RFC 4122 section 4.5)
        secure_random(*entropy_, node.data(), node.size());
        node[0] |= 0x01;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_sequence_ = static_cast<uint16_t>((seq[0] << 8) | seq[1]);
        node_ = node;
    }

    log_event(LogLevel::Info, "GenerationState",
              std::string(hardware ? "node address " : "random node address ") + format_node(node));
}

TimeSnapshot GenerationState::advance() {
    std::call_once(init_flag_, &GenerationState::initialize, this);

    std::lock_guard<std::mutex> lock(mutex_);

    const uint64_t now = clock_();
    if (now <= last_time_) {
        ++clock_sequence_;
        if (log_level() == LogLevel::Debug) {
            log_event(LogLevel::Debug, "GenerationState",
                      "clock did not advance, clock_sequence=" + std::to_string(clock_sequence_));
        }
    }
    last_time_ = now;

    TimeSnapshot snapshot;
    snapshot.timestamp = now;
    snapshot.clock_sequence = clock_sequence_;
    snapshot.node = node_;
    return snapshot;
}

} // namespace uuidpp
