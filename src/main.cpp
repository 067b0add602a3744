#include "codec/text_codec.hpp"
#include "config/command_line.hpp"
#include "utils/logger.hpp"
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    uuidpp::CommandLineOptions options;

    try {
        options = uuidpp::parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        uuidpp::print_usage(std::cerr, argv[0]);
        return 1;
    }

    if (options.show_help) {
        uuidpp::print_usage(std::cout, argv[0]);
        return 0;
    }

    if (options.config.verbose) {
        uuidpp::set_log_level(uuidpp::LogLevel::Debug);
    }

    try {
        if (!options.inspect_text.empty()) {
            uuidpp::print_inspection(std::cout, uuidpp::from_string(options.inspect_text));
            return 0;
        }

        std::vector<uuidpp::Uuid> uuids =
            uuidpp::generate_uuids(uuidpp::default_generator(), options.config);

        for (const auto& uuid : uuids) {
            std::cout << uuidpp::format(uuid, options.config.format) << '\n';
        }
        std::cout << std::flush;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
