#pragma once

#include <optional>
#include <ostream>

#include "options.hpp"

namespace cli {

/**
 * @brief Handle informational commands.
 *
 * Prints help or the version string. Returns `0` when one of them was
 * requested or `std::nullopt` if the dashboard should run.
 */
std::optional<int> handle_info_commands(const Options& opts, const char* prog);

/**
 * @brief Open the log file requested in @a opts.
 *
 * Does nothing when no log file is configured. A log file that cannot be
 * opened is reported on @p err and does not stop the run.
 */
void configure_logging(const Options& opts, std::ostream& err);

/**
 * @brief Print the instructions shown when no access token is available.
 */
void print_token_help(std::ostream& err);

/**
 * @brief Fetch the profile and contributions, then draw the dashboard.
 *
 * Requires a username and a token; without a token the guidance text is
 * printed and no request is made. The profile is fetched first and the
 * contributions only after it succeeded. Nothing is drawn unless both
 * succeed.
 *
 * @return `1` on a missing username or token or a failed profile fetch;
 *         `0` on success and when the contribution fetch fails (the error
 *         and a token hint are printed to @p err).
 */
int run_dashboard(const Options& opts, std::ostream& out, std::ostream& err);

} // namespace cli
