#pragma once

#include "config/config_loader.hpp"
#include "core/uuid.hpp"
#include "generator/generator.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace uuidpp {

// Result of parsing the uuidpp command line
struct CommandLineOptions {
    GeneratorConfig config;
    std::string inspect_text;  // --inspect; empty when generating
    bool show_help = false;
};

/**
 * @brief Parses argv into CommandLineOptions.
 *
 * A --config file is loaded before any other flag is applied, so flags
 * override the file regardless of their position. Parsing stops at --help.
 *
 * @throws ConfigLoadError for unknown options, missing values and numbers
 *         that are malformed or out of range
 */
CommandLineOptions parse_command_line(int argc, const char* const argv[]);

void print_usage(std::ostream& os, const char* program);

// Writes uuid, version, variant and, for versions 1 and 6, the embedded UTC time
void print_inspection(std::ostream& os, const Uuid& uuid);

// Generates config.count UUIDs on the calling thread when threads == 1 or
// count == 1, across a ThreadPool of config.threads workers otherwise.
// Throws ConfigLoadError if the config cannot produce a request.
std::vector<Uuid> generate_uuids(Generator& generator, const GeneratorConfig& config);

} // namespace uuidpp
