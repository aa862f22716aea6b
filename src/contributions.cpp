#include "contributions.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

CalendarStats compute_stats(const ContributionCalendar& calendar) {
    CalendarStats stats;
    for (const auto& week : calendar.weeks) {
        for (const auto& day : week.days) {
            if (day.contribution_count > 0)
                ++stats.active_days;
            stats.max_per_day = std::max(stats.max_per_day, day.contribution_count);
        }
    }
    if (stats.active_days > 0)
        stats.average_per_active_day = static_cast<double>(calendar.total_contributions) /
                                       static_cast<double>(stats.active_days);
    return stats;
}

std::string format_one_decimal(double value) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << value;
    return ss.str();
}
