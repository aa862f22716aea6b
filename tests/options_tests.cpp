#include "test_common.hpp"
#include "github_client.hpp"

using gitstat::test_support::EnvGuard;
using gitstat::test_support::write_temp_file;

TEST_CASE("parse_options defaults") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "octocat"};
    Options opts = parse_options(2, const_cast<char**>(argv));
    REQUIRE(opts.username == "octocat");
    REQUIRE_FALSE(opts.token);
    REQUIRE(opts.api_url == github::DEFAULT_API_URL);
    REQUIRE(opts.user_agent == "gitstat-cli");
    REQUIRE(opts.proxy_url.empty());
    REQUIRE_FALSE(opts.display.no_colors);
    REQUIRE(opts.display.width == 0);
    REQUIRE(opts.logging.log_level == LogLevel::INFO);
    REQUIRE(opts.logging.log_file.empty());
    REQUIRE_FALSE(opts.show_help);
    REQUIRE_FALSE(opts.print_version);
}

TEST_CASE("parse_options token flag") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "octocat", "--token", "abc123"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.token);
    REQUIRE(*opts.token == "abc123");
}

TEST_CASE("parse_options short token before username") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "-t", "abc123", "octocat"};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.username == "octocat");
    REQUIRE(*opts.token == "abc123");
}

TEST_CASE("parse_options token from environment") {
    EnvGuard env(TOKEN_ENV_VAR, "from-env");
    const char* argv[] = {"prog", "octocat"};
    Options opts = parse_options(2, const_cast<char**>(argv));
    REQUIRE(opts.token);
    REQUIRE(*opts.token == "from-env");
}

TEST_CASE("parse_options token flag wins over environment") {
    EnvGuard env(TOKEN_ENV_VAR, "from-env");
    const char* argv[] = {"prog", "octocat", "--token=from-flag"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(*opts.token == "from-flag");
}

TEST_CASE("parse_options empty token counts as absent") {
    EnvGuard env(TOKEN_ENV_VAR, "");
    const char* argv[] = {"prog", "octocat", "--token", ""};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE_FALSE(opts.token);
}

TEST_CASE("resolve_token order") {
    {
        EnvGuard env(TOKEN_ENV_VAR, "env");
        REQUIRE(resolve_token("flag") == std::optional<std::string>("flag"));
        REQUIRE(resolve_token("") == std::optional<std::string>("env"));
    }
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    REQUIRE_FALSE(resolve_token(""));
}

TEST_CASE("parse_options display flags") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "-C", "-w", "120", "octocat"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.display.no_colors);
    REQUIRE(opts.display.width == 120);
    REQUIRE(opts.username == "octocat");
}

TEST_CASE("parse_options switches accept inline booleans") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "--no-colors=false", "--json-log=0", "--verbose=yes",
                          "octocat"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE_FALSE(opts.display.no_colors);
    REQUIRE_FALSE(opts.logging.json_log);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
    REQUIRE(opts.username == "octocat");

    const char* argv2[] = {"prog", "--no-colors", "octocat"};
    REQUIRE(parse_options(3, const_cast<char**>(argv2)).display.no_colors);

    const char* argv3[] = {"prog", "--no-colors=maybe", "octocat"};
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv3)),
                        "Invalid boolean for --no-colors: maybe");
}

TEST_CASE("parse_options inline false overrides config") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    fs::path cfg = write_temp_file("gitstat_opts_inline.yaml", "no-colors: true\n");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "octocat", "-y", path.c_str(), "--no-colors=false"};
    REQUIRE_FALSE(parse_options(5, const_cast<char**>(argv)).display.no_colors);
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options rejects bad width") {
    const char* argv[] = {"prog", "octocat", "--width", "0"};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(argv)), std::runtime_error);
    const char* argv2[] = {"prog", "octocat", "--width", "wide"};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(argv2)), std::runtime_error);
}

TEST_CASE("parse_options unknown flag") {
    const char* argv[] = {"prog", "octocat", "--bogus"};
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)), "Unknown option: --bogus");
}

TEST_CASE("parse_options missing option value") {
    const char* argv[] = {"prog", "octocat", "--token"};
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)), "--token requires a value");
}

TEST_CASE("parse_options extra positional") {
    const char* argv[] = {"prog", "octocat", "hubot"};
    REQUIRE_THROWS_WITH(parse_options(3, const_cast<char**>(argv)), "Unexpected argument: hubot");
}

TEST_CASE("parse_options username flag") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "--username", "octocat"};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.username == "octocat");
}

TEST_CASE("parse_options help and version") {
    const char* argv[] = {"prog", "-h"};
    REQUIRE(parse_options(2, const_cast<char**>(argv)).show_help);
    const char* argv2[] = {"prog", "--version"};
    REQUIRE(parse_options(2, const_cast<char**>(argv2)).print_version);
}

TEST_CASE("parse_options logging flags") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog",           "octocat",         "--log-file", "run.log",
                          "--max-log-size", "1MB",             "--max-log-files", "3",
                          "--json-log",     "--compress-logs", "-g"};
    Options opts = parse_options(11, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_file == "run.log");
    REQUIRE(opts.logging.max_log_size == 1024 * 1024);
    REQUIRE(opts.logging.max_log_files == 3);
    REQUIRE(opts.logging.json_log);
    REQUIRE(opts.logging.compress_logs);
    REQUIRE(opts.logging.log_level == LogLevel::DEBUG);
}

TEST_CASE("parse_options log level overrides verbose") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    const char* argv[] = {"prog", "octocat", "--verbose", "--log-level", "warning"};
    Options opts = parse_options(5, const_cast<char**>(argv));
    REQUIRE(opts.logging.log_level == LogLevel::WARNING);
    const char* argv2[] = {"prog", "octocat", "-L", "LOUD"};
    REQUIRE_THROWS_WITH(parse_options(4, const_cast<char**>(argv2)), "Invalid log level: LOUD");
}

TEST_CASE("parse_options YAML config supplies values") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    fs::path cfg = write_temp_file("gitstat_opts.yaml", "username: octocat\n"
                                                        "token: from-config\n"
                                                        "Display:\n"
                                                        "  no-colors: yes\n"
                                                        "  width: 90\n"
                                                        "Network:\n"
                                                        "  api-url: http://127.0.0.1:1/\n");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "--config-yaml", path.c_str()};
    Options opts = parse_options(3, const_cast<char**>(argv));
    REQUIRE(opts.username == "octocat");
    REQUIRE(*opts.token == "from-config");
    REQUIRE(opts.display.no_colors);
    REQUIRE(opts.display.width == 90);
    REQUIRE(opts.api_url == "http://127.0.0.1:1/");
    REQUIRE(opts.config_file == cfg);
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options command line overrides config") {
    EnvGuard env(TOKEN_ENV_VAR, "from-env");
    fs::path cfg = write_temp_file("gitstat_opts.json",
                                   "{\"username\": \"hubot\", \"token\": \"from-config\", "
                                   "\"width\": 90}");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "octocat", "-j", path.c_str(), "--width", "70", "-t", "flag"};
    Options opts = parse_options(8, const_cast<char**>(argv));
    REQUIRE(opts.username == "octocat");
    REQUIRE(*opts.token == "flag");
    REQUIRE(opts.display.width == 70);
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options config token wins over environment") {
    EnvGuard env(TOKEN_ENV_VAR, "from-env");
    fs::path cfg = write_temp_file("gitstat_opts_token.json", "{\"token\": \"from-config\"}");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "octocat", "--config-json", path.c_str()};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(*opts.token == "from-config");
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options rejects unknown config keys") {
    fs::path cfg = write_temp_file("gitstat_opts_bad.yaml", "colour: red\n");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "octocat", "-y", path.c_str()};
    REQUIRE_THROWS_WITH(parse_options(4, const_cast<char**>(argv)),
                        "Unknown option in config: colour");
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options rejects invalid config booleans") {
    fs::path cfg = write_temp_file("gitstat_opts_bool.yaml", "no-colors: sometimes\n");
    std::string path = cfg.string();
    const char* argv[] = {"prog", "octocat", "-y", path.c_str()};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(argv)), std::runtime_error);
    FS_REMOVE(cfg);
}

TEST_CASE("parse_options missing config file") {
    const char* argv[] = {"prog", "octocat", "--config-yaml", "/nonexistent/gitstat.yaml"};
    REQUIRE_THROWS_AS(parse_options(4, const_cast<char**>(argv)), std::runtime_error);
}

TEST_CASE("parse_options loads a theme file") {
    EnvGuard env(TOKEN_ENV_VAR, nullptr);
    fs::path theme = write_temp_file("gitstat_opts_theme.json", "{\"info\": \"\\u001b[33m\"}");
    std::string path = theme.string();
    const char* argv[] = {"prog", "octocat", "--theme", path.c_str()};
    Options opts = parse_options(4, const_cast<char**>(argv));
    REQUIRE(opts.display.theme_file == path);
    REQUIRE(opts.display.theme.info == "\033[33m");
    FS_REMOVE(theme);
}
