// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/cli/commands.hpp>
#include <paraloader/core/http_transport.hpp>
#include <paraloader/core/log.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace paraloader::cli;

// Terminate handler to report exceptions escaping noexcept functions
static void paraloader_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

// First signal asks the download to stop; a second one exits at once
extern "C" void paraloader_signal_handler(int) {
    if (stop_requested()) {
        std::_Exit(STOPPED_EXIT_CODE);
    }
    request_stop();
}

int main(int argc, char* argv[]) {
    std::set_terminate(paraloader_terminate_handler);

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
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.url.empty()) {
        std::cerr << "Error: No URL specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    if (!args.info_only && args.output.empty()) {
        std::cerr << "Error: No output path specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 1;
    }

    paraloader::log::init(args.verbose, args.quiet);

    std::signal(SIGINT, paraloader_signal_handler);
    std::signal(SIGTERM, paraloader_signal_handler);

    paraloader::core::HttpTransport::global_init();

    auto result = args.info_only ? info(args) : download(args);

    paraloader::core::HttpTransport::global_cleanup();

    if (!result) {
        return 1;
    }
    return *result;
}
