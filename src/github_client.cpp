#include "github_client.hpp"
#include "http_utils.hpp"
#include "logger.hpp"
#include <utility>

namespace github {

Client::Client(std::string api_url, std::string user_agent, std::string proxy)
    : api_url_(std::move(api_url)), user_agent_(std::move(user_agent)), proxy_(std::move(proxy)) {
    while (!api_url_.empty() && api_url_.back() == '/')
        api_url_.pop_back();
}

static http::Response transfer(const http::Request& req) {
    log_debug("HTTP request", {{"method", req.post ? "POST" : "GET"}, {"url", req.url}});
    try {
        http::Response resp = http::perform(req);
        log_debug("HTTP response", {{"url", req.url}, {"status", std::to_string(resp.status)}});
        return resp;
    } catch (const http::TransportError& e) {
        log_error("HTTP transport failure", {{"url", req.url}, {"error", e.what()}});
        throw FetchError(FetchErrorKind::Transport, std::string("Request failed: ") + e.what());
    }
}

Profile Client::fetch_profile(const std::string& username) const {
    http::Request req;
    req.url = api_url_ + "/users/" + http::escape(username);
    req.headers = {"User-Agent: " + user_agent_, "Accept: application/vnd.github+json"};
    req.proxy = proxy_;
    http::Response resp = transfer(req);
    if (!resp.ok())
        throw FetchError(FetchErrorKind::NotFound, "User '" + username + "' not found");
    Profile p = parse_profile(resp.body);
    log_info("Fetched profile", {{"login", p.login}});
    return p;
}

ContributionCalendar Client::fetch_contributions(const std::string& username,
                                                 const std::string& token) const {
    http::Request req;
    req.url = api_url_ + "/graphql";
    req.headers = {"Authorization: Bearer " + token, "User-Agent: " + user_agent_,
                   "Content-Type: application/json"};
    req.body = build_contributions_request(username);
    req.post = true;
    req.proxy = proxy_;
    http::Response resp = transfer(req);
    if (!resp.ok())
        throw FetchError(FetchErrorKind::HttpStatus, "HTTP error: " + std::to_string(resp.status));
    ContributionCalendar cal = parse_contributions_response(resp.body, username);
    log_info("Fetched contributions", {{"login", username},
                                       {"weeks", std::to_string(cal.weeks.size())},
                                       {"total", std::to_string(cal.total_contributions)}});
    return cal;
}

} // namespace github
