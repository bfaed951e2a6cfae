// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026 Tony Narlock

#include "http_server.h"

#include <config/config.h>

#include <systemd/sd-journal.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "HTTP health-check daemon. Answers GET /health with {\"status\": \"ok\"}.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help           Show this help message\n"
              << "  -v, --version        Show version information\n"
              << "\n"
              << "Environment:\n"
              << "  PORT                 TCP port to listen on (default: 8081)\n"
              << "  HEALTHD_CONFIG       Optional TOML configuration file\n"
              << "\n";
}

void print_version() {
    std::cout << "healthd 0.1.0\n"
              << "Copyright (C) 2026 Tony Narlock\n"
              << "License: GPL-3.0-or-later\n";
}

} // anonymous namespace

auto main(int argc, char* argv[]) -> int {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == "-v" || arg == "--version") {
            print_version();
            return EXIT_SUCCESS;
        }
        std::cerr << "Error: Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try {
        auto config_result = healthd::load_config_from_environment();
        if (!config_result) {
            std::cerr << "Configuration error: " << config_result.error() << "\n";
            sd_journal_print(LOG_ERR, "healthd: Configuration error: %s",
                             config_result.error().c_str());
            return EXIT_FAILURE;
        }

        // Runs until the process is terminated externally
        healthd::api::HttpServer server(std::move(config_result->server));
        auto run_result = server.start();
        if (!run_result) {
            std::cerr << "Failed to start HTTP server: " << run_result.error() << "\n";
            sd_journal_print(LOG_ERR, "healthd: Failed to start HTTP server: %s",
                             run_result.error().c_str());
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        sd_journal_print(LOG_CRIT, "healthd: Fatal error: %s", e.what());
        return EXIT_FAILURE;
    }
}
