#include "test_common.hpp"
#include "cli_commands.hpp"
#include "http_utils.hpp"
#include <sstream>

using gitstat::test_support::EnvGuard;

TEST_CASE("handle_info_commands") {
    Options opts;
    REQUIRE_FALSE(cli::handle_info_commands(opts, "gitstat"));
    opts.print_version = true;
    REQUIRE(cli::handle_info_commands(opts, "gitstat") == std::optional<int>(0));
    opts.print_version = false;
    opts.show_help = true;
    REQUIRE(cli::handle_info_commands(opts, "gitstat") == std::optional<int>(0));
}

TEST_CASE("print_token_help lists every token source") {
    std::ostringstream err;
    cli::print_token_help(err);
    const std::string text = err.str();
    REQUIRE(text.rfind("Error: GitHub token required!\n", 0) == 0);
    REQUIRE(text.find("--token YOUR_TOKEN") != std::string::npos);
    REQUIRE(text.find("GITHUB_TOKEN environment variable") != std::string::npos);
    REQUIRE(text.find("https://github.com/settings/tokens") != std::string::npos);
    REQUIRE(text.find("'read:user'") != std::string::npos);
}

TEST_CASE("run_dashboard requires a username") {
    Options opts;
    opts.token = "tok";
    std::ostringstream out, err;
    REQUIRE(cli::run_dashboard(opts, out, err) == 1);
    REQUIRE(out.str().empty());
    REQUIRE(err.str().find("username") != std::string::npos);
}

TEST_CASE("configure_logging opens the log file") {
    fs::path log = fs::temp_directory_path() / "gitstat_cli_log.log";
    FS_REMOVE(log);
    Options opts;
    opts.logging.log_file = log.string();
    std::ostringstream err;
    cli::configure_logging(opts, err);
    REQUIRE(err.str().empty());
    REQUIRE(logger_initialized());
    shutdown_logger();
    FS_REMOVE(log);
}

TEST_CASE("configure_logging reports an unusable path") {
    Options opts;
    opts.logging.log_file = "/nonexistent/dir/gitstat.log";
    std::ostringstream err;
    cli::configure_logging(opts, err);
    REQUIRE(err.str() == "Failed to open log file: /nonexistent/dir/gitstat.log\n");
    REQUIRE_FALSE(logger_initialized());
}

#ifndef _WIN32

using gitstat::test_support::http_response;
using gitstat::test_support::TestHttpServer;

namespace {

const char* const PROFILE_BODY =
    R"({"login":"octocat","name":null,"public_repos":8,"followers":100,"following":9})";

const char* const CALENDAR_BODY =
    R"({"data":{"user":{"login":"octocat","name":null,"contributionsCollection":
    {"contributionCalendar":{"totalContributions":4,"weeks":[{"contributionDays":[
    {"date":"2024-01-07","contributionCount":0,"color":"#ebedf0"},
    {"date":"2024-01-08","contributionCount":4,"color":"#40c463"}]}]}}}}})";

struct LoopbackEnv {
    EnvGuard no_proxy{"no_proxy", "127.0.0.1,localhost"};
    EnvGuard no_proxy_upper{"NO_PROXY", "127.0.0.1,localhost"};
    http::CurlInitGuard curl;
};

Options dashboard_options(const std::string& api_url, const std::string& username) {
    Options opts;
    opts.username = username;
    opts.token = "tok123";
    opts.api_url = api_url;
    opts.user_agent = "gitstat-cli";
    opts.display.no_colors = true;
    opts.display.width = 80;
    return opts;
}

std::string github_like(const std::string& line, const std::string& graphql_body) {
    if (line.rfind("GET /users/octocat ", 0) == 0)
        return http_response(200, PROFILE_BODY);
    if (line.rfind("GET /users/", 0) == 0)
        return http_response(404, R"({"message":"Not Found"})");
    return http_response(200, graphql_body);
}

} // namespace

TEST_CASE("run_dashboard without a token makes no requests") {
    LoopbackEnv env;
    TestHttpServer server([](const std::string& line) { return github_like(line, CALENDAR_BODY); });
    Options opts = dashboard_options(server.url(), "octocat");
    opts.token.reset();
    std::ostringstream out, err;
    REQUIRE(cli::run_dashboard(opts, out, err) == 1);
    REQUIRE(server.request_count() == 0);
    REQUIRE(out.str().empty());
    REQUIRE(err.str().rfind("Error: GitHub token required!", 0) == 0);
}

TEST_CASE("run_dashboard stops after an unknown user") {
    LoopbackEnv env;
    TestHttpServer server([](const std::string& line) { return github_like(line, CALENDAR_BODY); });
    Options opts = dashboard_options(server.url(), "doesnotexist123");
    std::ostringstream out, err;
    REQUIRE(cli::run_dashboard(opts, out, err) == 1);
    REQUIRE(server.request_count() == 1);
    REQUIRE(server.request_lines()[0].rfind("GET /users/doesnotexist123", 0) == 0);
    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "Error: User 'doesnotexist123' not found\n");
}

TEST_CASE("run_dashboard reports contribution errors and exits cleanly") {
    LoopbackEnv env;
    TestHttpServer server([](const std::string& line) {
        return github_like(line, R"({"data":null,"errors":[{"message":"Bad credentials"}]})");
    });
    Options opts = dashboard_options(server.url(), "octocat");
    std::ostringstream out, err;
    REQUIRE(cli::run_dashboard(opts, out, err) == 0);
    REQUIRE(server.request_count() == 2);
    REQUIRE(out.str().empty());
    REQUIRE(err.str() == "Error retrieving contributions: GraphQL errors: Bad credentials\n"
                         "Please verify your token is valid and has proper permissions\n");
}

TEST_CASE("run_dashboard draws profile and calendar") {
    LoopbackEnv env;
    TestHttpServer server([](const std::string& line) { return github_like(line, CALENDAR_BODY); });
    Options opts = dashboard_options(server.url(), "octocat");
    std::ostringstream out, err;
    REQUIRE(cli::run_dashboard(opts, out, err) == 0);
    REQUIRE(err.str().empty());
    REQUIRE(server.request_count() == 2);
    REQUIRE(server.request_lines()[1].rfind("POST /graphql", 0) == 0);
    const std::string text = out.str();
    REQUIRE(text.find(" octocat ") != std::string::npos);
    REQUIRE(text.find("Name: octocat  |  Repos: 8  |  Followers: 100  |  Following: 9") !=
            std::string::npos);
    REQUIRE(text.find("Total Contributions: 4") != std::string::npos);
    REQUIRE(text.find("Active Days: 1  |  Max/Day: 4  |  Avg/Active Day: 4.0") !=
            std::string::npos);
    REQUIRE(text.find('\033') == std::string::npos);
}

#endif
