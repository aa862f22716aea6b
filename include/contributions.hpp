#ifndef CONTRIBUTIONS_HPP
#define CONTRIBUTIONS_HPP
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Public profile fields of a GitHub user.
 */
struct Profile {
    std::string login;               ///< Account login
    std::optional<std::string> name; ///< Display name, absent when unset
    unsigned int public_repos = 0;   ///< Number of public repositories
    unsigned int followers = 0;      ///< Follower count
    unsigned int following = 0;      ///< Following count

    /** @return The display name, or the login when no name is set. */
    const std::string& display_name() const { return name ? *name : login; }
};

/**
 * @brief Activity of a single calendar day.
 */
struct ContributionDay {
    std::string date;                    ///< ISO calendar date (YYYY-MM-DD)
    unsigned int contribution_count = 0; ///< Contributions on that day
    std::string color;                   ///< Color suggested by the API, not used for drawing
};

/**
 * @brief One calendar week, at most seven days, first day first.
 */
struct ContributionWeek {
    std::vector<ContributionDay> days;
};

/**
 * @brief A year of contributions grouped into weeks, in API order.
 */
struct ContributionCalendar {
    unsigned int total_contributions = 0;
    std::vector<ContributionWeek> weeks;
};

/**
 * @brief Aggregates shown in the statistics section.
 */
struct CalendarStats {
    unsigned int active_days = 0;        ///< Days with at least one contribution
    unsigned int max_per_day = 0;        ///< Largest single-day count
    double average_per_active_day = 0.0; ///< total / active_days, 0.0 without active days
};

/**
 * @brief Compute the statistics of @p calendar.
 *
 * The average divides the calendar's reported total by the number of active
 * days, not the sum of the day counts.
 */
CalendarStats compute_stats(const ContributionCalendar& calendar);

/**
 * @brief Format a value with exactly one decimal, e.g. 5 -> "5.0".
 */
std::string format_one_decimal(double value);

#endif // CONTRIBUTIONS_HPP
