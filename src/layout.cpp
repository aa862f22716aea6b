#include "layout.hpp"
#include <algorithm>
#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace layout {

TerminalGeometry query_terminal_size() {
    TerminalGeometry geo;
#ifdef _WIN32
    CONSOLE_SCREEN_BUFFER_INFO csbi;
    if (GetConsoleScreenBufferInfo(GetStdHandle(STD_OUTPUT_HANDLE), &csbi)) {
        int cols = csbi.srWindow.Right - csbi.srWindow.Left + 1;
        int rows = csbi.srWindow.Bottom - csbi.srWindow.Top + 1;
        if (cols > 0 && rows > 0) {
            geo.width = static_cast<std::size_t>(cols);
            geo.height = static_cast<std::size_t>(rows);
        }
    }
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0 && w.ws_row > 0) {
        geo.width = w.ws_col;
        geo.height = w.ws_row;
    }
#endif
    return geo;
}

std::size_t calendar_columns(std::size_t width) {
    std::size_t avail = width > CALENDAR_MARGIN ? width - CALENDAR_MARGIN : 0;
    return std::min(MAX_CALENDAR_WEEKS, avail / 2);
}

std::size_t center_padding(std::size_t width, std::size_t length) {
    return width > length ? (width - length) / 2 : 0;
}

std::size_t weeks_to_draw(std::size_t week_count, std::size_t budget) {
    return std::min(week_count, budget);
}

int contribution_bucket(unsigned int count) {
    if (count == 0)
        return 0;
    if (count <= 2)
        return 1;
    if (count <= 5)
        return 2;
    if (count <= 10)
        return 3;
    return 4;
}

std::size_t display_width(const std::string& s) {
    std::size_t cells = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == 0x1b && i + 1 < s.size() && s[i + 1] == '[') {
            // CSI: parameters end with a byte in 0x40-0x7e
            i += 2;
            while (i < s.size() && (static_cast<unsigned char>(s[i]) < 0x40 ||
                                    static_cast<unsigned char>(s[i]) > 0x7e))
                ++i;
            continue;
        }
        if ((c & 0xC0) != 0x80)
            ++cells;
    }
    return cells;
}

} // namespace layout
