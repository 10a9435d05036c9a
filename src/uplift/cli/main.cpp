// Copyright (c) 2026 changcheng967. All rights reserved.

#include <uplift/cli/commands.hpp>
#include <uplift/version.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace uplift::cli;

// Terminate handler to catch exceptions in noexcept functions
static void uplift_terminate_handler() {
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
    std::set_terminate(uplift_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.files.empty()) {
        std::cerr << "Error: No file specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    auto result = upload(args);
    if (!result) {
        return 1;
    }
    return *result;
}
