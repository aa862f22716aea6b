#ifndef GITHUB_CLIENT_HPP
#define GITHUB_CLIENT_HPP

#include <string>
#include "contributions.hpp"
#include "github_api.hpp"

namespace github {

constexpr const char* DEFAULT_API_URL = "https://api.github.com";
constexpr const char* DEFAULT_USER_AGENT = "gitstat-cli";

/**
 * @brief Issues the two GitHub requests behind the dashboard.
 *
 * Every call performs exactly one HTTP request with no retry. Failures are
 * reported as @ref FetchError.
 */
class Client {
  public:
    explicit Client(std::string api_url = DEFAULT_API_URL,
                    std::string user_agent = DEFAULT_USER_AGENT, std::string proxy = "");

    /**
     * @brief Fetch public profile fields with `GET <api>/users/<username>`.
     *
     * No authentication is sent.
     *
     * @throws FetchError Transport on connection failure, NotFound
     *         ("User '<username>' not found") on any non-success status,
     *         InvalidResponse on an undecodable body.
     */
    Profile fetch_profile(const std::string& username) const;

    /**
     * @brief Fetch the last-year contribution calendar through GraphQL.
     *
     * Sends an authenticated `POST <api>/graphql` with a bearer token.
     *
     * @throws FetchError Transport, HttpStatus ("HTTP error: <code>"),
     *         Upstream, MissingData, NotFound or InvalidResponse.
     */
    ContributionCalendar fetch_contributions(const std::string& username,
                                             const std::string& token) const;

    const std::string& api_url() const { return api_url_; }

  private:
    std::string api_url_;
    std::string user_agent_;
    std::string proxy_;
};

} // namespace github

#endif // GITHUB_CLIENT_HPP
