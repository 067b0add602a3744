#pragma once

#include "core/uuid.hpp"
#include "generator/generation_state.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>

namespace uuidpp {

// POSIX user and group ids embedded in version 2 UUIDs
struct PosixIdentity {
    uint32_t uid = 0;
    uint32_t gid = 0;
};

// getuid() / getgid() of the running process
PosixIdentity current_posix_identity();

/**
 * @brief Builds UUIDs of versions 1 through 6.
 *
 * Time-based versions (1, 2) read and advance the bound GenerationState;
 * random bytes (4, 6) come from that state's entropy source. Thread-safe:
 * a single Generator may be shared by any number of threads.
 */
class Generator {
public:
    explicit Generator(GenerationState& state,
                       PosixIdentity identity = current_posix_identity());

    // Timestamp, clock sequence and node address
    Uuid new_v1();

    // DCE security: like v1, with the UID (Person) or GID (Group) in place of
    // time_low and the domain in byte 9
    Uuid new_v2(Domain domain);

    // MD5 of namespace bytes followed by name
    Uuid new_v3(const Uuid& ns, std::string_view name) const;

    // 122 random bits
    Uuid new_v4();

    // SHA-1 of namespace bytes followed by name
    Uuid new_v5(const Uuid& ns, std::string_view name) const;

    // Version 6: 40-bit Unix seconds followed by random bytes
    Uuid new_time(std::chrono::system_clock::time_point time);
    Uuid new_time();

private:
    GenerationState& state_;
    PosixIdentity identity_;
};

// Generator bound to GenerationState::instance()
Generator& default_generator();

Uuid new_v1();
Uuid new_v2(Domain domain);
Uuid new_v3(const Uuid& ns, std::string_view name);
Uuid new_v4();
Uuid new_v5(const Uuid& ns, std::string_view name);
Uuid new_time(std::chrono::system_clock::time_point time);
Uuid new_time();

} // namespace uuidpp
