#pragma once

#include "concurrency/thread_pool.hpp"
#include "core/uuid.hpp"
#include "generator/generator.hpp"

#include <string>
#include <vector>

namespace uuidpp {

// What to generate: version plus the inputs that version needs
struct GenerationRequest {
    unsigned version = 4;
    size_t count = 1;
    Uuid namespace_id;      // versions 3 and 5
    std::string name;       // versions 3 and 5
    Domain domain = Domain::Person;  // version 2
};

// Builds one UUID for request.version. Throws std::invalid_argument for a
// version outside 1..6.
Uuid generate_one(Generator& generator, const GenerationRequest& request);

/**
 * @brief Generates request.count UUIDs, split into one chunk per worker.
 *
 * Results keep submission order: chunk i fills the i-th slice of the output.
 * Exceptions raised by a worker propagate from this call.
 */
std::vector<Uuid> generate_bulk(Generator& generator, const GenerationRequest& request,
                                ThreadPool& pool);

} // namespace uuidpp
