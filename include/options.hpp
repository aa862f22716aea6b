#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include "logger.hpp"
#include "tui.hpp"

/// Environment variable holding the fallback access token.
constexpr const char* TOKEN_ENV_VAR = "GITHUB_TOKEN";

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 1;
    bool json_log = false;
    bool compress_logs = false;
};

struct DisplayOptions {
    bool no_colors = false;
    unsigned int width = 0; ///< Forced terminal width, 0 to detect
    std::string theme_file;
    TuiTheme theme;
};

struct Options {
    std::string username;
    std::optional<std::string> token; ///< Unset when no source provided one
    std::string api_url;
    std::string user_agent;
    std::string proxy_url;
    DisplayOptions display;
    LoggingOptions logging;
    std::filesystem::path config_file;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Parse command line arguments and configuration files into Options.
 *
 * Values given on the command line override values from `--config-yaml`,
 * `--config-json` or an auto-discovered `.gitstat.yaml`/`.gitstat.json`.
 * The token falls back to the `GITHUB_TOKEN` environment variable. A missing
 * username or token is not an error here; the caller decides.
 *
 * @throws std::runtime_error on unknown flags, unknown config keys, missing
 *         or invalid option values, or unreadable config/theme files.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Pick the access token: @p explicit_token when non-empty, otherwise
 *        a non-empty `GITHUB_TOKEN` environment variable.
 */
std::optional<std::string> resolve_token(const std::string& explicit_token);

#endif // OPTIONS_HPP
