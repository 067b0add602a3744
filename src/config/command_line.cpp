#include "config/command_line.hpp"
#include "codec/text_codec.hpp"
#include "concurrency/thread_pool.hpp"
#include "generator/bulk_generator.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <limits>
#include <ostream>
#include <stdexcept>

namespace uuidpp {

namespace {

const char* variantName(Variant variant) {
    switch (variant) {
        case Variant::NCS: return "NCS";
        case Variant::RFC4122: return "RFC4122";
        case Variant::Microsoft: return "Microsoft";
        case Variant::Future: return "Future";
    }
    return "unknown";
}

// Parses a decimal flag value into [min_value, max_value]
uint64_t parseUnsigned(const std::string& flag, const std::string& text,
                       uint64_t min_value, uint64_t max_value) {
    const bool digits_only = !text.empty() &&
        std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits_only) {
        throw ConfigLoadError("'" + flag + "' expects a non-negative integer (got \"" + text + "\")");
    }

    unsigned long long value = 0;
    try {
        value = std::stoull(text);
    } catch (const std::out_of_range&) {
        throw ConfigLoadError("'" + flag + "' is out of range (got \"" + text + "\")");
    }

    if (value < min_value || value > max_value) {
        throw ConfigLoadError("'" + flag + "' must be between " + std::to_string(min_value) +
                              " and " + std::to_string(max_value) + " (got \"" + text + "\")");
    }
    return value;
}

// Returns the value following argv[i] and advances i
std::string takeValue(int argc, const char* const argv[], int& i) {
    if (i + 1 >= argc) {
        throw ConfigLoadError(std::string("'") + argv[i] + "' requires a value");
    }
    return argv[++i];
}

} // anonymous namespace

CommandLineOptions parse_command_line(int argc, const char* const argv[]) {
    CommandLineOptions options;

    // The config file is applied first so that flags override it
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            options.config = load_config_from_file(takeValue(argc, argv, i));
        }
    }

    constexpr uint64_t kMaxSize = std::numeric_limits<size_t>::max();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            return options;
        } else if (arg == "--config") {
            ++i;
        } else if (arg == "--version") {
            options.config.version = static_cast<unsigned>(parseUnsigned(arg, takeValue(argc, argv, i), 1, 6));
        } else if (arg == "--count") {
            options.config.count = static_cast<size_t>(parseUnsigned(arg, takeValue(argc, argv, i), 1, kMaxSize));
        } else if (arg == "--namespace") {
            options.config.namespace_id = takeValue(argc, argv, i);
        } else if (arg == "--name") {
            options.config.name = takeValue(argc, argv, i);
        } else if (arg == "--domain") {
            options.config.domain = parse_domain(takeValue(argc, argv, i));
        } else if (arg == "--format") {
            options.config.format = parse_text_format(takeValue(argc, argv, i));
        } else if (arg == "--threads") {
            options.config.threads = static_cast<size_t>(parseUnsigned(arg, takeValue(argc, argv, i), 0, kMaxSize));
        } else if (arg == "--inspect") {
            options.inspect_text = takeValue(argc, argv, i);
        } else if (arg == "--verbose") {
            options.config.verbose = true;
        } else {
            throw ConfigLoadError("Unknown option: " + arg);
        }
    }

    return options;
}

void print_usage(std::ostream& os, const char* program) {
    os << "Usage: " << program << " [options]\n"
       << "\nOptions:\n"
       << "  --config <file>      Path to JSON config file\n"
       << "  --version <1-6>      UUID version to generate (default: 4)\n"
       << "  --count <n>          Number of UUIDs to generate (default: 1)\n"
       << "  --namespace <ns>     dns, url, oid, x500 or a UUID (versions 3, 5; default: dns)\n"
       << "  --name <text>        Name to hash (versions 3, 5)\n"
       << "  --domain <d>         person, group or org (version 2; default: person)\n"
       << "  --format <f>         canonical, braced or urn (default: canonical)\n"
       << "  --threads <n>        Worker threads, 0 = all cores (default: 1)\n"
       << "  --inspect <uuid>     Print version, variant and time of a UUID\n"
       << "  --verbose            Log diagnostics to stderr\n"
       << "  --help               Show this help message\n"
       << std::endl;
}

void print_inspection(std::ostream& os, const Uuid& uuid) {
    os << "uuid:     " << uuid << "\n"
       << "version:  " << uuid.version() << "\n"
       << "variant:  " << variantName(uuid.variant()) << "\n";

    if (auto time = uuid.time()) {
        const auto seconds = static_cast<std::time_t>(time->time_since_epoch().count());
        std::tm utc_tm{};
        if (gmtime_r(&seconds, &utc_tm) != nullptr) {
            os << "time:     " << std::put_time(&utc_tm, "%Y-%m-%d %H:%M:%S") << " UTC\n";
        } else {
            os << "time:     " << seconds << " s since 1970-01-01 UTC\n";
        }
    }
    os << std::flush;
}

std::vector<Uuid> generate_uuids(Generator& generator, const GeneratorConfig& config) {
    GenerationRequest request = to_request(config);

    if (config.threads == 1 || request.count == 1) {
        std::vector<Uuid> uuids;
        uuids.reserve(request.count);
        for (size_t i = 0; i < request.count; ++i) {
            uuids.push_back(generate_one(generator, request));
        }
        return uuids;
    }

    ThreadPool pool(config.threads);
    return generate_bulk(generator, request, pool);
}

} // namespace uuidpp
