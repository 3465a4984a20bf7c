// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fetchr/cli/commands.hpp>
#include <fetchr/core/config.hpp>
#include <fetchr/core/log.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace fetchr::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void fetchr_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
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
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(fetchr_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    // Handle help
    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    // Handle version
    if (args.version) {
        print_version();
        return 0;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    auto settings = fetchr::core::Settings::from_env();
    fetchr::log::set_level(settings.log_level);
    if (args.verbose) {
        fetchr::log::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        fetchr::log::set_level(spdlog::level::warn);
    }

    auto result = args.info ? info(args, settings) : download(args, settings);
    if (!result) {
        return 1;
    }
    return *result;
}
