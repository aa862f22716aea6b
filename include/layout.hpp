#ifndef LAYOUT_HPP
#define LAYOUT_HPP

#include <cstddef>
#include <string>

namespace layout {

constexpr std::size_t DEFAULT_WIDTH = 80;
constexpr std::size_t DEFAULT_HEIGHT = 24;
constexpr std::size_t MAX_CALENDAR_WEEKS = 53; ///< One year of week columns
constexpr std::size_t CALENDAR_MARGIN = 40;    ///< Columns reserved before the grid gets any
constexpr std::size_t LABEL_GUTTER = 4;        ///< "Mon " prefix of every grid row
constexpr int BUCKET_COUNT = 5;

/**
 * @brief Size of the output terminal in character cells.
 */
struct TerminalGeometry {
    std::size_t width = DEFAULT_WIDTH;
    std::size_t height = DEFAULT_HEIGHT;
};

/**
 * @brief Query the size of the terminal attached to standard output.
 *
 * Falls back to 80x24 when standard output is not a terminal or the host
 * reports a zero size.
 */
TerminalGeometry query_terminal_size();

/**
 * @brief Number of week columns the heat-map may use for a terminal of @p width.
 *
 * `min(53, max(0, width - 40) / 2)`.
 */
std::size_t calendar_columns(std::size_t width);

/**
 * @brief Left padding that centers a line of @p length cells in @p width.
 *
 * `max(0, width - length) / 2`; odd remainders leave the extra column on the
 * right.
 */
std::size_t center_padding(std::size_t width, std::size_t length);

/**
 * @brief Weeks actually drawn: `min(week_count, budget)`.
 */
std::size_t weeks_to_draw(std::size_t week_count, std::size_t budget);

/**
 * @brief Map a daily contribution count to its heat-map level.
 *
 * 0 -> 0, 1-2 -> 1, 3-5 -> 2, 6-10 -> 3, 11 and above -> 4.
 */
int contribution_bucket(unsigned int count);

/**
 * @brief Number of terminal cells occupied by UTF-8 text @p s.
 *
 * Counts code points, skipping ANSI CSI escape sequences.
 */
std::size_t display_width(const std::string& s);

} // namespace layout

#endif // LAYOUT_HPP
