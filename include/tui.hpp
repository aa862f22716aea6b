#ifndef TUI_HPP
#define TUI_HPP

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include "contributions.hpp"
#include "layout.hpp"

/**
 * @brief Enable ANSI color sequences on Windows consoles.
 *
 * Has no effect on other platforms.
 */
void enable_win_ansi();

/**
 * @brief Theme definition for the dashboard colors.
 *
 * Contains raw ANSI sequences for each color used by the renderer. The
 * heat-map levels default to 24-bit colors of increasing brightness.
 */
struct TuiTheme {
    std::string reset = "\033[0m";
    std::string border = "\033[94m";  ///< Horizontal rules
    std::string title = "\033[1;97m"; ///< Section titles
    std::string info = "\033[96m";    ///< Profile and statistics lines
    std::string accent = "\033[94m";  ///< Totals, month and weekday labels
    std::array<std::string, layout::BUCKET_COUNT> levels = {
        "\033[38;2;45;51;59m", "\033[38;2;14;68;121m", "\033[38;2;33;110;177m",
        "\033[38;2;52;152;219m", "\033[38;2;116;185;255m"};
};

/**
 * @brief Resolved color codes for the renderer.
 */
struct TuiColors {
    std::string reset;
    std::string border;
    std::string title;
    std::string info;
    std::string accent;
    std::array<std::string, layout::BUCKET_COUNT> levels;
};

/**
 * @brief Create a color palette honoring user preferences.
 *
 * @param no_colors When true, every sequence is empty.
 * @param theme     Default set of color codes.
 */
TuiColors make_tui_colors(bool no_colors, const TuiTheme& theme);

/**
 * @brief A full-width line of box-drawing characters.
 */
std::string render_rule(std::size_t width, const TuiColors& colors);

/**
 * @brief Render the profile header.
 *
 * Rule, centered ` <login> ` title, centered
 * `Name: ..  |  Repos: ..  |  Followers: ..  |  Following: ..`, rule.
 */
std::string render_header(const Profile& profile, std::size_t width, const TuiColors& colors);

/**
 * @brief Render the contribution heat-map.
 *
 * Title, total line, month labels, seven weekday rows and the legend. At most
 * @ref layout::calendar_columns(width) weeks are drawn, oldest first.
 */
std::string render_calendar(const ContributionCalendar& calendar, std::size_t width,
                            const TuiColors& colors);

/**
 * @brief Render the statistics footer with a closing rule.
 */
std::string render_stats(const ContributionCalendar& calendar, std::size_t width,
                         const TuiColors& colors);

/**
 * @brief Header, calendar and statistics concatenated.
 */
std::string render_dashboard(const Profile& profile, const ContributionCalendar& calendar,
                             std::size_t width, const TuiColors& colors);

/**
 * @brief Write the dashboard to @p out in one flush.
 */
void draw_dashboard(std::ostream& out, const Profile& profile,
                    const ContributionCalendar& calendar,
                    const layout::TerminalGeometry& geometry, bool no_colors,
                    const TuiTheme& theme);

#endif // TUI_HPP
