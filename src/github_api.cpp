#include "github_api.hpp"
#include <nlohmann/json.hpp>

using nlohmann::json;

void from_json(const json& j, Profile& p) {
    j.at("login").get_to(p.login);
    auto name = j.find("name");
    if (name != j.end() && name->is_string())
        p.name = name->get<std::string>();
    else
        p.name.reset();
    j.at("public_repos").get_to(p.public_repos);
    j.at("followers").get_to(p.followers);
    j.at("following").get_to(p.following);
}

void from_json(const json& j, ContributionDay& d) {
    j.at("date").get_to(d.date);
    j.at("contributionCount").get_to(d.contribution_count);
    d.color = j.value("color", std::string());
}

void from_json(const json& j, ContributionWeek& w) {
    j.at("contributionDays").get_to(w.days);
}

void from_json(const json& j, ContributionCalendar& c) {
    j.at("totalContributions").get_to(c.total_contributions);
    j.at("weeks").get_to(c.weeks);
}

namespace github {

const char* const CONTRIBUTIONS_QUERY = R"(
        query($username: String!) {
            user(login: $username) {
                login
                name
                contributionsCollection {
                    contributionCalendar {
                        totalContributions
                        weeks {
                            contributionDays {
                                date
                                contributionCount
                                color
                            }
                        }
                    }
                }
            }
        }
    )";

std::string build_contributions_request(const std::string& username) {
    json req{{"query", CONTRIBUTIONS_QUERY}, {"variables", {{"username", username}}}};
    return req.dump();
}

Profile parse_profile(const std::string& body) {
    try {
        return json::parse(body).get<Profile>();
    } catch (const json::exception& e) {
        throw FetchError(FetchErrorKind::InvalidResponse,
                         std::string("Invalid profile response: ") + e.what());
    }
}

ContributionCalendar parse_contributions_response(const std::string& body,
                                                  const std::string& username) {
    json root;
    try {
        root = json::parse(body);
    } catch (const json::exception& e) {
        throw FetchError(FetchErrorKind::InvalidResponse,
                         std::string("Invalid contributions response: ") + e.what());
    }
    if (!root.is_object())
        throw FetchError(FetchErrorKind::InvalidResponse,
                         "Invalid contributions response: envelope is not an object");

    auto errors = root.find("errors");
    if (errors != root.end() && errors->is_array() && !errors->empty()) {
        std::string joined;
        for (const auto& err : *errors) {
            if (!joined.empty())
                joined += ", ";
            if (err.is_object() && err.contains("message") && err["message"].is_string())
                joined += err["message"].get<std::string>();
            else
                joined += err.dump();
        }
        throw FetchError(FetchErrorKind::Upstream, "GraphQL errors: " + joined);
    }

    auto data = root.find("data");
    if (data == root.end() || data->is_null())
        throw FetchError(FetchErrorKind::MissingData, "No data returned by API");
    if (!data->is_object())
        throw FetchError(FetchErrorKind::InvalidResponse,
                         "Invalid contributions response: data is not an object");

    auto user = data->find("user");
    if (user == data->end() || user->is_null())
        throw FetchError(FetchErrorKind::NotFound, "User '" + username + "' not found");

    try {
        return user->at("contributionsCollection")
            .at("contributionCalendar")
            .get<ContributionCalendar>();
    } catch (const json::exception& e) {
        throw FetchError(FetchErrorKind::InvalidResponse,
                         std::string("Invalid contributions response: ") + e.what());
    }
}

} // namespace github
