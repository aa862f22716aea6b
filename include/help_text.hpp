#ifndef HELP_TEXT_HPP
#define HELP_TEXT_HPP

/**
 * @brief Print usage and the grouped option list to standard output.
 *
 * @param prog Program name shown in the usage line.
 */
void print_help(const char* prog);

#endif // HELP_TEXT_HPP
