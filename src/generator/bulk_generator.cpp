#include "generator/bulk_generator.hpp"
#include "utils/logger.hpp"

#include <stdexcept>

namespace uuidpp {

Uuid generate_one(Generator& generator, const GenerationRequest& request) {
    switch (request.version) {
        case 1: return generator.new_v1();
        case 2: return generator.new_v2(request.domain);
        case 3: return generator.new_v3(request.namespace_id, request.name);
        case 4: return generator.new_v4();
        case 5: return generator.new_v5(request.namespace_id, request.name);
        case 6: return generator.new_time();
        default:
            throw std::invalid_argument("Unsupported UUID version: " + std::to_string(request.version));
    }
}

std::vector<Uuid> generate_bulk(Generator& generator, const GenerationRequest& request,
                                ThreadPool& pool) {
    if (request.count == 0) {
        return {};
    }
    if (request.version < 1 || request.version > 6) {
        throw std::invalid_argument("Unsupported UUID version: " + std::to_string(request.version));
    }

    log_event(LogLevel::Debug, "BulkGenerator",
              "version=" + std::to_string(request.version) +
              ", count=" + std::to_string(request.count) +
              ", chunks=" + std::to_string(pool.chunk_count(request.count)));

    std::vector<Uuid> output(request.count);
    pool.run_chunked(request.count, [&generator, &request, &output](size_t begin, size_t end) {
        for (size_t i = begin; i < end; ++i) {
            output[i] = generate_one(generator, request);
        }
    });

    return output;
}

} // namespace uuidpp
