#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

static std::string flag_column(const OptionInfo& o) {
    std::string flag = "  ";
    if (std::strlen(o.short_flag))
        flag += std::string(o.short_flag) + ", ";
    else
        flag += "    ";
    flag += o.long_flag;
    if (std::strlen(o.arg))
        flag += " " + std::string(o.arg);
    return flag;
}

void print_help(const char* prog) {
    static const std::vector<OptionInfo> opts = {
        {"--token", "-t", "<token>", "GitHub access token (or set GITHUB_TOKEN)", "Basics"},
        {"--username", "", "<login>", "GitHub login, alternative to the positional argument",
         "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--width", "-w", "<cols>", "Override the detected terminal width", "Display"},
        {"--no-colors", "-C", "", "Disable ANSI colors", "Display"},
        {"--theme", "", "<file>", "Load colors from a JSON or YAML theme", "Display"},
        {"--config-yaml", "-y", "<file>", "Load options from YAML file", "Config"},
        {"--config-json", "-j", "<file>", "Load options from JSON file", "Config"},
        {"--auto-config", "", "", "Use .gitstat.yaml or .gitstat.json if present", "Config"},
        {"--api-url", "", "<url>", "API base URL (default https://api.github.com)", "Network"},
        {"--user-agent", "", "<name>", "User-Agent header (default gitstat-cli)", "Network"},
        {"--proxy", "", "<url>", "Send requests through a proxy", "Network"},
        {"--log-file", "-l", "<path>", "Write diagnostics to a log file", "Logging"},
        {"--log-level", "-L", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--verbose", "-g", "", "Shorthand for --log-level DEBUG", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate --log-file when over this size", "Logging"},
        {"--max-log-files", "", "<n>", "Rotated log files to keep", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        width = std::max(width, flag_column(o).size());
    }

    std::cout << "gitstat - Display GitHub activity for any user\n";
    std::cout << "Fetches a public profile and the last year of contributions and\n";
    std::cout << "draws them as a heat-map dashboard.\n\n";
    std::cout << "Usage: " << prog << " <username> [--token <token>] [options]\n\n";
    const std::vector<std::string> order{"Basics", "Display", "Config", "Network", "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat])
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag_column(*o)
                      << o->desc << "\n";
        std::cout << "\n";
    }
}
