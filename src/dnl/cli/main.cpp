// Copyright (c) 2026 changcheng967. All rights reserved.

#include <dnl/cli/commands.hpp>
#include <dnl/cli/interrupt.hpp>
#include <dnl/core/http_session.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <stop_token>

using namespace dnl::cli;

// Terminate handler to catch exceptions in noexcept functions
static void dnl_terminate_handler() {
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
    std::set_terminate(dnl_terminate_handler);
    // Parse arguments
    CliArgs args = parse_args(argc, argv);

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

    if (!args.errors.empty()) {
        for (const auto& error : args.errors) {
            std::cerr << "Error: " << error << std::endl;
        }
        std::cout << "Use -h for help" << std::endl;
        return 2;
    }

    if (args.history) {
        auto result = history(args.ledger_dir);
        return result ? *result : 1;
    }

    // Need at least one URL
    if (args.urls.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    dnl::core::HttpSession::global_init();

    int exit_code = 0;
    if (args.info) {
        auto config = resolve_config(args);
        if (!config) {
            std::cerr << "Error: cannot load config " << args.config_path << ": "
                      << config.error().message() << std::endl;
            exit_code = 1;
        } else {
            for (const auto& url : args.urls) {
                if (!info(url, *config)) {
                    exit_code = 1;
                }
            }
        }
    } else {
        // Ctrl-C cancels every in-flight transfer
        std::stop_source cancel;
        InterruptGuard guard(cancel);

        auto result = download(args, cancel.get_token());
        exit_code = result ? *result : 1;
        if (guard.interrupted() && exit_code == 0) {
            exit_code = 130;
        }
    }

    dnl::core::HttpSession::global_cleanup();
    return exit_code;
}
