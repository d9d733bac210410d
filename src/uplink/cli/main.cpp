// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplink/cli/commands.hpp>
#include <uplink/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace uplink::cli;

// Report exceptions escaping noexcept functions before aborting
static void uplink_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(uplink_terminate_handler);
    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (args.verbose) {
        uplink::core::log::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        uplink::core::log::set_level(spdlog::level::warn);
    }

    CliResult result;
    switch (args.command) {
        case Command::probe:
            if (args.urls.empty() && args.config_path.empty()) {
                std::cerr << "Error: No URL specified" << std::endl;
                std::cout << "Use -h for help" << std::endl;
                return 1;
            }
            result = probe(args);
            break;
        case Command::replay:
            result = replay(args);
            break;
        case Command::none:
            std::cerr << "Error: No command specified" << std::endl;
            std::cout << "Use -h for help" << std::endl;
            return 1;
    }

    return result ? *result : 1;
}
