#pragma once

#include "codec/text_codec.hpp"
#include "generator/bulk_generator.hpp"
#include <string>
#include <cstdint>
#include <stdexcept>

namespace uuidpp {

// Exception for configuration loading errors
class ConfigLoadError : public std::runtime_error {
public:
    explicit ConfigLoadError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

// Settings of the uuidpp command line tool
struct GeneratorConfig {
    unsigned version = 4;
    size_t count = 1;
    std::string namespace_id = "dns";  // dns, url, oid, x500 or a UUID string
    std::string name;                  // Required by versions 3 and 5
    Domain domain = Domain::Person;
    TextFormat format = TextFormat::Canonical;
    size_t threads = 1;                // 0 = hardware_concurrency
    bool verbose = false;
};

// Load GeneratorConfig from a JSON file
// Returns default config if file doesn't exist or is empty
// Throws ConfigLoadError for invalid JSON or invalid values
GeneratorConfig load_config_from_file(const std::string& file_path);

// Load GeneratorConfig from a JSON string
// Throws ConfigLoadError for invalid JSON or invalid values
GeneratorConfig load_config_from_string(const std::string& json_string);

// "person", "group" or "org"; throws ConfigLoadError otherwise
Domain parse_domain(const std::string& text);

// "canonical", "braced" or "urn"; throws ConfigLoadError otherwise
TextFormat parse_text_format(const std::string& text);

// Resolves the namespace and checks the inputs the version needs
// Throws ConfigLoadError if the config cannot produce a request
GenerationRequest to_request(const GeneratorConfig& config);

} // namespace uuidpp
