#include "config/config_loader.hpp"
#include "core/errors.hpp"
#include "generator/namespaces.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace uuidpp {

namespace {

// Helper to parse JSON from string
nlohmann::json parseJson(const std::string& json_string) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_string);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigLoadError("Invalid JSON: " + std::string(e.what()));
    }

    if (!j.is_object()) {
        throw ConfigLoadError("JSON root must be an object");
    }

    return j;
}

std::string readString(const nlohmann::json& j, const char* key) {
    if (!j[key].is_string()) {
        throw ConfigLoadError(std::string("'") + key + "' must be a string");
    }
    return j[key].get<std::string>();
}

void parseGeneratorConfig(const nlohmann::json& j, GeneratorConfig& config) {
    if (j.contains("version")) {
        if (!j["version"].is_number_unsigned()) {
            throw ConfigLoadError("'version' must be a positive integer");
        }
        auto version = j["version"].get<uint64_t>();
        if (version < 1 || version > 6) {
            throw ConfigLoadError("'version' must be between 1 and 6");
        }
        config.version = static_cast<unsigned>(version);
    }

    if (j.contains("count")) {
        if (!j["count"].is_number_unsigned()) {
            throw ConfigLoadError("'count' must be a positive integer");
        }
        size_t count = j["count"].get<size_t>();
        if (count == 0) {
            throw ConfigLoadError("'count' must be greater than 0");
        }
        config.count = count;
    }

    if (j.contains("namespace")) {
        config.namespace_id = readString(j, "namespace");
    }

    if (j.contains("name")) {
        config.name = readString(j, "name");
    }

    if (j.contains("domain")) {
        config.domain = parse_domain(readString(j, "domain"));
    }

    if (j.contains("format")) {
        config.format = parse_text_format(readString(j, "format"));
    }

    if (j.contains("threads")) {
        if (!j["threads"].is_number_unsigned()) {
            throw ConfigLoadError("'threads' must be a non-negative integer");
        }
        config.threads = j["threads"].get<size_t>();
    }

    if (j.contains("verbose")) {
        if (!j["verbose"].is_boolean()) {
            throw ConfigLoadError("'verbose' must be a boolean");
        }
        config.verbose = j["verbose"].get<bool>();
    }
}

// Helper to read file contents
std::string readFileContents(const std::string& file_path) {
    std::ifstream file(file_path);

    if (!file.is_open()) {
        return "";  // File doesn't exist
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // anonymous namespace

Domain parse_domain(const std::string& text) {
    if (text == "person") return Domain::Person;
    if (text == "group") return Domain::Group;
    if (text == "org") return Domain::Org;
    throw ConfigLoadError("'domain' must be one of person, group, org (got \"" + text + "\")");
}

TextFormat parse_text_format(const std::string& text) {
    if (text == "canonical") return TextFormat::Canonical;
    if (text == "braced") return TextFormat::Braced;
    if (text == "urn") return TextFormat::Urn;
    throw ConfigLoadError("'format' must be one of canonical, braced, urn (got \"" + text + "\")");
}

GeneratorConfig load_config_from_string(const std::string& json_string) {
    GeneratorConfig config;

    if (json_string.empty()) {
        return config;  // Return defaults for empty string
    }

    nlohmann::json j = parseJson(json_string);
    parseGeneratorConfig(j, config);

    return config;
}

GeneratorConfig load_config_from_file(const std::string& file_path) {
    std::string content = readFileContents(file_path);

    if (content.empty()) {
        return GeneratorConfig{};  // Empty or non-existent file - return defaults
    }

    return load_config_from_string(content);
}

GenerationRequest to_request(const GeneratorConfig& config) {
    if (config.version < 1 || config.version > 6) {
        throw ConfigLoadError("'version' must be between 1 and 6");
    }
    if (config.count == 0) {
        throw ConfigLoadError("'count' must be greater than 0");
    }

    GenerationRequest request;
    request.version = config.version;
    request.count = config.count;
    request.domain = config.domain;

    if (config.version == 3 || config.version == 5) {
        if (config.name.empty()) {
            throw ConfigLoadError("'name' is required for version " + std::to_string(config.version));
        }
        if (auto ns = namespace_by_name(config.namespace_id)) {
            request.namespace_id = *ns;
        } else {
            try {
                request.namespace_id = from_string(config.namespace_id);
            } catch (const FormatError&) {
                throw ConfigLoadError("'namespace' must be dns, url, oid, x500 or a UUID (got \"" +
                                      config.namespace_id + "\")");
            }
        }
        request.name = config.name;
    }

    return request;
}

} // namespace uuidpp
