#include "generator/entropy.hpp"
#include "utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <cstdlib>
#include <string>

namespace uuidpp {

bool OpenSslEntropySource::fill(uint8_t* dest, size_t size) {
    if (size > static_cast<size_t>(INT_MAX)) {
        return false;
    }
    return RAND_bytes(dest, static_cast<int>(size)) == 1;
}

std::shared_ptr<EntropySource> default_entropy_source() {
    static std::shared_ptr<EntropySource> source = std::make_shared<OpenSslEntropySource>();
    return source;
}

void secure_random(EntropySource& source, uint8_t* dest, size_t size) {
    if (source.fill(dest, size)) {
        return;
    }

    std::string details = "secure random source failed to supply " + std::to_string(size) + " bytes";
    unsigned long err = ERR_get_error();
    if (err != 0) {
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        details += " (" + std::string(buf) + ")";
    }
    log_event(LogLevel::Fatal, "Entropy", details);
    std::abort();
}

} // namespace uuidpp
