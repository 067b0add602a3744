#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace uuidpp {

// Source of cryptographically secure random bytes
class EntropySource {
public:
    virtual ~EntropySource() = default;

    // Fills size bytes at dest. Returns false if the source cannot supply them.
    virtual bool fill(uint8_t* dest, size_t size) = 0;
};

// OpenSSL RAND_bytes
class OpenSslEntropySource final : public EntropySource {
public:
    bool fill(uint8_t* dest, size_t size) override;
};

// Shared OpenSSL-backed source used when no other source is injected
std::shared_ptr<EntropySource> default_entropy_source();

/**
 * @brief Fills dest from source or terminates the process.
 *
 * A UUID built from predictable bytes silently breaks uniqueness, so an
 * entropy failure is logged at fatal level and followed by std::abort().
 * No weaker source is ever substituted.
 */
void secure_random(EntropySource& source, uint8_t* dest, size_t size);

} // namespace uuidpp
