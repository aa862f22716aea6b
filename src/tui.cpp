#include "tui.hpp"
#include <algorithm>
#include <ostream>
#include <sstream>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

#ifdef _WIN32
/**
 * @brief Enable ANSI escape sequence processing on Windows consoles.
 *
 * Also switches the console output code page to UTF-8 so the box-drawing
 * and block glyphs come out intact.
 */
void enable_win_ansi() {
    SetConsoleOutputCP(CP_UTF8);
    HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return;
    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return;
    dwMode |= 0x0004; // ENABLE_VIRTUAL_TERMINAL_PROCESSING
    SetConsoleMode(hOut, dwMode);
}
#else
/**
 * @brief Stub for non-Windows platforms where ANSI sequences already work.
 */
void enable_win_ansi() {}
#endif

namespace {

const char* const RULE_GLYPH = "\u2500";
const char* const CELL_GLYPH = "\u25A0";

const char* const MONTHS[12] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
const char* const WEEKDAYS[3] = {"Mon", "Wed", "Fri"};

constexpr std::size_t MONTH_STRIDE = 4;
constexpr std::size_t DAYS_PER_WEEK = 7;

void centered_line(std::ostringstream& out, std::size_t width, const std::string& text,
                   const std::string& color, const std::string& reset) {
    out << std::string(layout::center_padding(width, layout::display_width(text)), ' ') << color
        << text << reset << "\n";
}

} // namespace

TuiColors make_tui_colors(bool no_colors, const TuiTheme& theme) {
    if (no_colors)
        return TuiColors{};
    return {theme.reset, theme.border, theme.title, theme.info, theme.accent,
            theme.levels};
}

std::string render_rule(std::size_t width, const TuiColors& c) {
    std::string line;
    line.reserve(width * 3);
    for (std::size_t i = 0; i < width; ++i)
        line += RULE_GLYPH;
    return c.border + line + c.reset + "\n";
}

std::string render_header(const Profile& profile, std::size_t width, const TuiColors& c) {
    std::ostringstream out;
    out << render_rule(width, c);
    centered_line(out, width, " " + profile.login + " ", c.title, c.reset);
    std::ostringstream info;
    info << "Name: " << profile.display_name() << "  |  Repos: " << profile.public_repos
         << "  |  Followers: " << profile.followers << "  |  Following: " << profile.following;
    centered_line(out, width, info.str(), c.info, c.reset);
    out << render_rule(width, c);
    return out.str();
}

std::string render_calendar(const ContributionCalendar& calendar, std::size_t width,
                            const TuiColors& c) {
    std::ostringstream out;
    centered_line(out, width, " GitHub Activity (Last Year) ", c.title, c.reset);
    centered_line(out, width,
                  "Total Contributions: " + std::to_string(calendar.total_contributions), c.accent,
                  c.reset);
    out << "\n";

    const std::size_t shown =
        layout::weeks_to_draw(calendar.weeks.size(), layout::calendar_columns(width));
    // Gutter and grid are centered as one block so every row shares a left edge.
    const std::string indent(layout::center_padding(width, layout::LABEL_GUTTER + shown), ' ');

    // A month label starts on every fourth week column and may run into the
    // next two; it is clipped at the right edge of the grid.
    out << indent << std::string(layout::LABEL_GUTTER, ' ');
    for (std::size_t i = 0; i < shown;) {
        if (i % MONTH_STRIDE == 0 && i / MONTH_STRIDE < 12) {
            std::string label = MONTHS[i / MONTH_STRIDE];
            std::size_t n = std::min(label.size(), shown - i);
            out << c.accent << label.substr(0, n) << c.reset;
            i += n;
        } else {
            out << ' ';
            ++i;
        }
    }
    out << "\n";

    for (std::size_t row = 0; row < DAYS_PER_WEEK; ++row) {
        out << indent;
        if (row % 2 == 1 && row / 2 < 3)
            out << c.accent << WEEKDAYS[row / 2] << c.reset << ' ';
        else
            out << std::string(layout::LABEL_GUTTER, ' ');
        for (std::size_t w = 0; w < shown; ++w) {
            const auto& days = calendar.weeks[w].days;
            if (row < days.size()) {
                int bucket = layout::contribution_bucket(days[row].contribution_count);
                out << c.levels[static_cast<std::size_t>(bucket)] << CELL_GLYPH << c.reset;
            } else {
                out << ' ';
            }
        }
        out << "\n";
    }

    out << "\n";
    const std::string less = "Less  ";
    const std::string more = "  More";
    std::size_t legend_width =
        less.size() + static_cast<std::size_t>(layout::BUCKET_COUNT) + more.size();
    out << std::string(layout::center_padding(width, legend_width), ' ') << less;
    for (const auto& level : c.levels)
        out << level << CELL_GLYPH << c.reset;
    out << more << "\n";
    return out.str();
}

std::string render_stats(const ContributionCalendar& calendar, std::size_t width,
                         const TuiColors& c) {
    CalendarStats stats = compute_stats(calendar);
    std::ostringstream out;
    out << "\n";
    centered_line(out, width, " Statistics ", c.title, c.reset);
    std::ostringstream line;
    line << "Active Days: " << stats.active_days << "  |  Max/Day: " << stats.max_per_day
         << "  |  Avg/Active Day: " << format_one_decimal(stats.average_per_active_day);
    centered_line(out, width, line.str(), c.info, c.reset);
    out << render_rule(width, c);
    return out.str();
}

std::string render_dashboard(const Profile& profile, const ContributionCalendar& calendar,
                             std::size_t width, const TuiColors& colors) {
    return render_header(profile, width, colors) + render_calendar(calendar, width, colors) +
           render_stats(calendar, width, colors);
}

void draw_dashboard(std::ostream& out, const Profile& profile,
                    const ContributionCalendar& calendar,
                    const layout::TerminalGeometry& geometry, bool no_colors,
                    const TuiTheme& theme) {
    TuiColors colors = make_tui_colors(no_colors, theme);
    out << render_dashboard(profile, calendar, geometry.width, colors) << std::flush;
}
