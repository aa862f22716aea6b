/**
 * @file gitstat.cpp
 * @brief CLI entry point drawing a GitHub activity dashboard.
 *
 * Resolves options, fetches the user's profile and contribution calendar
 * through libcurl and renders them to the terminal.
 */

#include <iostream>

#include "cli_commands.hpp"
#include "http_utils.hpp"
#include "logger.hpp"
#include "options.hpp"
#include "tui.hpp"

/**
 * @brief Application entry point.
 *
 * @return int Zero on success, when printing help/version, or when only the
 *             contribution fetch failed; 1 on configuration errors, a missing
 *             token or a failed profile fetch.
 */
int main(int argc, char* argv[]) {
    try {
        Options opts = parse_options(argc, argv);
        if (auto rc = cli::handle_info_commands(opts, argv[0]); rc)
            return *rc;
        cli::configure_logging(opts, std::cerr);
        enable_win_ansi();
        http::CurlInitGuard curl_guard;
        int rc = cli::run_dashboard(opts, std::cout, std::cerr);
        shutdown_logger();
        return rc;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        shutdown_logger();
        return 1;
    }
}
