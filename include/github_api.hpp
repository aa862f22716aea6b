#ifndef GITHUB_API_HPP
#define GITHUB_API_HPP
#include <stdexcept>
#include <string>
#include "contributions.hpp"

/**
 * @brief Category of a failed GitHub request.
 */
enum class FetchErrorKind {
    Transport,      ///< Connection or TLS failure, no HTTP response
    HttpStatus,     ///< Non-success HTTP status
    NotFound,       ///< Requested user does not exist
    Upstream,       ///< GraphQL response carried an errors list
    MissingData,    ///< GraphQL response had no data payload
    InvalidResponse ///< Body could not be decoded
};

/**
 * @brief Error raised by the profile and contribution fetchers.
 */
class FetchError : public std::runtime_error {
  public:
    FetchError(FetchErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}
    FetchErrorKind kind() const noexcept { return kind_; }

  private:
    FetchErrorKind kind_;
};

namespace github {

/** GraphQL query requesting the last-year contribution calendar of `$username`. */
extern const char* const CONTRIBUTIONS_QUERY;

/**
 * @brief Build the JSON request body `{"query": ..., "variables": {"username": ...}}`.
 */
std::string build_contributions_request(const std::string& username);

/**
 * @brief Decode a `GET /users/{username}` response body.
 *
 * Unknown fields are ignored; `name` may be missing or null.
 *
 * @throws FetchError with kind InvalidResponse on malformed JSON or missing
 *         required fields.
 */
Profile parse_profile(const std::string& body);

/**
 * @brief Decode a GraphQL contributions response envelope.
 *
 * @param body     Raw response body.
 * @param username Login the query was issued for, used in error messages.
 * @return Calendar taken from `data.user.contributionsCollection.contributionCalendar`.
 * @throws FetchError with kind Upstream ("GraphQL errors: a, b"), MissingData
 *         ("No data returned by API"), NotFound ("User '<name>' not found") or
 *         InvalidResponse.
 */
ContributionCalendar parse_contributions_response(const std::string& body,
                                                  const std::string& username);

} // namespace github

#endif // GITHUB_API_HPP
