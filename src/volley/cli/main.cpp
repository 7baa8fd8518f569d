// Copyright (c) 2026 changcheng967. All rights reserved.

#include <volley/cli/commands.hpp>
#include <volley/core/log.hpp>
#include <exception>
#include <iostream>

using namespace volley::cli;

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return exit_code::ok;
    }

    if (args.version) {
        print_version();
        return exit_code::ok;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return exit_code::usage;
    }

    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return exit_code::usage;
    }

    // Logging: --log-level wins over -V/-q
    if (!args.log_level.empty()) {
        auto level = volley::core::parse_log_level(args.log_level);
        if (!level) {
            std::cerr << "Error: Unknown log level: " << args.log_level << std::endl;
            return exit_code::usage;
        }
        volley::core::set_log_level(*level);
    } else if (args.verbose) {
        volley::core::set_log_level(spdlog::level::debug);
    } else if (args.quiet) {
        volley::core::set_log_level(spdlog::level::err);
    }

    auto config = build_config(args);
    if (!config) {
        // Unreadable config files count as usage errors too
        std::cerr << "Error: " << config.error().message() << std::endl;
        return exit_code::usage;
    }

    install_signal_handlers();

    try {
        return args.info ? info(args, *config) : download(args, *config);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return exit_code::integrity;
    }
}
