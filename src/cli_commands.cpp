#include "cli_commands.hpp"

#include <iostream>

#include "github_client.hpp"
#include "help_text.hpp"
#include "layout.hpp"
#include "logger.hpp"
#include "tui.hpp"
#include "version.hpp"

namespace cli {

std::optional<int> handle_info_commands(const Options& opts, const char* prog) {
    if (opts.show_help) {
        print_help(prog);
        return 0;
    }
    if (opts.print_version) {
        std::cout << GITSTAT_VERSION << "\n";
        return 0;
    }
    return std::nullopt;
}

void configure_logging(const Options& opts, std::ostream& err) {
    const LoggingOptions& lo = opts.logging;
    if (lo.log_file.empty())
        return;
    if (!init_logger(lo.log_file, lo.log_level, lo.max_log_size, lo.max_log_files)) {
        err << "Failed to open log file: " << lo.log_file << "\n";
        return;
    }
    set_json_logging(lo.json_log);
    set_log_compression(lo.compress_logs);
    log_debug("Logger initialized", {{"version", GITSTAT_VERSION}});
}

void print_token_help(std::ostream& err) {
    err << "Error: GitHub token required!\n"
        << "You can:\n"
        << "   1. Pass token with --token YOUR_TOKEN\n"
        << "   2. Set " << TOKEN_ENV_VAR << " environment variable\n"
        << "   3. Create a token at: https://github.com/settings/tokens\n"
        << "      (Required permissions: 'read:user' only)\n";
}

int run_dashboard(const Options& opts, std::ostream& out, std::ostream& err) {
    if (opts.username.empty()) {
        err << "Error: a GitHub username is required\n"
            << "Usage: gitstat <username> [--token <token>] [options]\n";
        return 1;
    }
    if (!opts.token) {
        log_error("No access token configured", {{"user", opts.username}});
        print_token_help(err);
        return 1;
    }

    github::Client client(opts.api_url, opts.user_agent, opts.proxy_url);

    Profile profile;
    try {
        profile = client.fetch_profile(opts.username);
    } catch (const FetchError& e) {
        log_error("Profile fetch failed", {{"user", opts.username}, {"error", e.what()}});
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    ContributionCalendar calendar;
    try {
        calendar = client.fetch_contributions(opts.username, *opts.token);
    } catch (const FetchError& e) {
        log_error("Contribution fetch failed", {{"user", opts.username}, {"error", e.what()}});
        err << "Error retrieving contributions: " << e.what() << "\n"
            << "Please verify your token is valid and has proper permissions\n";
        return 0;
    }

    layout::TerminalGeometry geometry = layout::query_terminal_size();
    if (opts.display.width > 0)
        geometry.width = opts.display.width;
    log_debug("Rendering dashboard", {{"width", std::to_string(geometry.width)},
                                      {"weeks", std::to_string(calendar.weeks.size())}});
    draw_dashboard(out, profile, calendar, geometry, opts.display.no_colors, opts.display.theme);
    return 0;
}

} // namespace cli
