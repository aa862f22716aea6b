#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <string>
#include "tui.hpp"

/**
 * @brief Load configuration options from a YAML file.
 *
 * Top-level scalar keys become options named `--<key>`. A top-level map is
 * treated as a category and its scalar entries are read the same way, so
 * `Display: {width: 120}` yields `--width=120`. Values are kept as text and
 * null becomes an empty string. Lists, and maps nested below a category, are
 * rejected with the offending key in @p error.
 *
 * @param path  Filesystem path to the YAML configuration file.
 * @param opts  Map receiving option values keyed by `--name`.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load configuration options from a JSON file.
 *
 * Same layout rules as @ref load_yaml_config.
 */
bool load_json_config(const std::string& path, std::map<std::string, std::string>& opts,
                      std::string& error);

/**
 * @brief Load a color theme for the dashboard.
 *
 * The file format follows the extension (`.json`, otherwise YAML). Recognized
 * keys are `reset`, `border`, `title`, `info`, `accent` and `level0` through
 * `level4`; each value is a raw ANSI escape sequence. Unknown keys are ignored.
 *
 * @param path  Filesystem path to the theme file.
 * @param theme Theme updated in place on success.
 * @param error Output string capturing a human-readable error message on
 *              failure.
 * @return `true` if the theme was loaded successfully.
 */
bool load_theme(const std::string& path, TuiTheme& theme, std::string& error);

#endif // CONFIG_UTILS_HPP
