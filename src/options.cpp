#include <cstdlib>
#include <filesystem>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "github_client.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::set<std::string> KNOWN_FLAGS{"--token",         "--username",      "--help",
                                        "--version",       "--config-yaml",   "--config-json",
                                        "--auto-config",   "--api-url",       "--user-agent",
                                        "--proxy",         "--width",         "--no-colors",
                                        "--theme",         "--log-file",      "--log-level",
                                        "--verbose",       "--max-log-size",  "--max-log-files",
                                        "--json-log",      "--compress-logs"};

const std::set<std::string> VALUE_FLAGS{"--token",        "--username",    "--config-yaml",
                                        "--config-json",  "--api-url",     "--user-agent",
                                        "--proxy",        "--width",       "--theme",
                                        "--log-file",     "--log-level",   "--max-log-size",
                                        "--max-log-files"};

const std::map<char, std::string> SHORT_FLAGS{{'t', "--token"},     {'h', "--help"},
                                              {'V', "--version"},   {'y', "--config-yaml"},
                                              {'j', "--config-json"}, {'C', "--no-colors"},
                                              {'l', "--log-file"},  {'L', "--log-level"},
                                              {'g', "--verbose"},   {'w', "--width"}};

// Options that only make sense on the command line.
const std::set<std::string> CLI_ONLY{"--help", "--version", "--config-yaml", "--config-json",
                                     "--auto-config"};

fs::path find_auto_config(const char* argv0) {
    auto find_cfg = [](const fs::path& dir) -> fs::path {
        if (dir.empty())
            return {};
        std::error_code ec;
        fs::path y = dir / ".gitstat.yaml";
        if (fs::exists(y, ec))
            return y;
        fs::path j = dir / ".gitstat.json";
        if (fs::exists(j, ec))
            return j;
        return {};
    };
    std::error_code ec;
    fs::path cfg = find_cfg(fs::current_path(ec));
    if (cfg.empty() && argv0)
        cfg = find_cfg(fs::absolute(argv0, ec).parent_path());
    return cfg;
}

void load_config_file(const fs::path& path, bool yaml, std::map<std::string, std::string>& cfg) {
    std::string err;
    bool ok = yaml ? load_yaml_config(path.string(), cfg, err)
                   : load_json_config(path.string(), cfg, err);
    if (!ok)
        throw std::runtime_error("Failed to load config " + path.string() + ": " + err);
}

} // namespace

std::optional<std::string> resolve_token(const std::string& explicit_token) {
    if (!explicit_token.empty())
        return explicit_token;
    const char* env = std::getenv(TOKEN_ENV_VAR);
    if (env && *env)
        return std::string(env);
    return std::nullopt;
}

Options parse_options(int argc, char* argv[]) {
    ArgParser parser(argc, argv, KNOWN_FLAGS, VALUE_FLAGS, SHORT_FLAGS);
    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");

    std::map<std::string, std::string> cfg_opts;
    if (parser.has_flag("--config-yaml")) {
        opts.config_file = parser.get_option("--config-yaml");
        load_config_file(opts.config_file, true, cfg_opts);
    } else if (parser.has_flag("--config-json")) {
        opts.config_file = parser.get_option("--config-json");
        load_config_file(opts.config_file, false, cfg_opts);
    } else if (parser.has_flag("--auto-config")) {
        opts.config_file = find_auto_config(argc > 0 ? argv[0] : nullptr);
        if (!opts.config_file.empty())
            load_config_file(opts.config_file, opts.config_file.extension() == ".yaml", cfg_opts);
    }
    for (const auto& kv : cfg_opts) {
        if (!KNOWN_FLAGS.count(kv.first) || CLI_ONLY.count(kv.first))
            throw std::runtime_error("Unknown option in config: " + kv.first.substr(2));
    }

    auto has = [&](const std::string& k) { return parser.has_flag(k) || cfg_opts.count(k) > 0; };
    auto value = [&](const std::string& k) {
        if (parser.has_flag(k))
            return parser.get_option(k);
        auto it = cfg_opts.find(k);
        return it != cfg_opts.end() ? it->second : std::string();
    };
    auto to_bool = [](const std::string& k, const std::string& text) {
        bool ok = false;
        bool v = parse_bool(text, ok);
        if (!ok)
            throw std::runtime_error("Invalid boolean for " + k + ": " + text);
        return v;
    };
    // A bare switch is true; `--switch=value` is parsed like a config value.
    auto flag = [&](const std::string& k) {
        if (parser.has_flag(k)) {
            std::string inline_val = parser.get_option(k);
            return inline_val.empty() ? true : to_bool(k, inline_val);
        }
        auto it = cfg_opts.find(k);
        if (it == cfg_opts.end())
            return false;
        return to_bool(k, it->second);
    };
    auto required = [&](const std::string& k, const char* what) {
        std::string v = value(k);
        if (v.empty())
            throw std::runtime_error(k + " requires " + what);
        return v;
    };

    if (!parser.positional().empty())
        opts.username = parser.positional().front();
    else
        opts.username = value("--username");
    if (parser.positional().size() > 1)
        throw std::runtime_error("Unexpected argument: " + parser.positional()[1]);

    opts.token = resolve_token(value("--token"));

    opts.api_url = has("--api-url") ? required("--api-url", "a URL") : github::DEFAULT_API_URL;
    opts.user_agent =
        has("--user-agent") ? required("--user-agent", "a value") : github::DEFAULT_USER_AGENT;
    if (has("--proxy"))
        opts.proxy_url = required("--proxy", "a URL");

    bool ok = false;
    opts.display.no_colors = flag("--no-colors");
    if (has("--width")) {
        opts.display.width = parse_uint(value("--width"), 1, 1000, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --width");
    }
    if (has("--theme")) {
        opts.display.theme_file = required("--theme", "a file");
        std::string err;
        if (!load_theme(opts.display.theme_file, opts.display.theme, err))
            throw std::runtime_error("Failed to load theme " + opts.display.theme_file + ": " +
                                     err);
    }

    if (has("--log-file"))
        opts.logging.log_file = required("--log-file", "a path");
    if (flag("--verbose"))
        opts.logging.log_level = LogLevel::DEBUG;
    if (has("--log-level"))
        opts.logging.log_level = parse_log_level(required("--log-level", "a value"));
    if (has("--max-log-size")) {
        opts.logging.max_log_size = parse_bytes(value("--max-log-size"), ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-size");
    }
    if (has("--max-log-files")) {
        opts.logging.max_log_files = parse_uint(value("--max-log-files"), 1, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid value for --max-log-files");
    }
    opts.logging.json_log = flag("--json-log");
    opts.logging.compress_logs = flag("--compress-logs");
    return opts;
}
