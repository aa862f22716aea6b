#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (`--flag`, `--opt value` or
 * `--opt=value`) and single character aliases (`-t value`, `-tvalue`,
 * `-t=value`) mapped to their long form. Only options listed in
 * @a value_flags consume the following argument as their value, so a bare
 * switch never swallows a positional argument such as the username.
 * Flags missing from @a known_flags are collected and reported separately.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value options given without a value
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> value_flags_;          ///< Flags that take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    void record(const std::string& key, const std::string* val) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (val)
            options_[key] = *val;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Set of flags that are considered valid. If empty,
     *        all flags are treated as known.
     * @param value_flags Flags that expect a value.
     * @param short_map Mapping from single character options (e.g. '-t') to
     *        their long form (e.g. '--token').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool only_positional = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (only_positional || arg == "-" || arg.empty() || arg[0] != '-') {
                positional_.push_back(arg);
                continue;
            }
            if (arg == "--") {
                only_positional = true;
                continue;
            }
            std::string key;
            std::string inline_val;
            bool has_inline = false;
            if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                key = arg.substr(0, eq);
                if (eq != std::string::npos) {
                    inline_val = arg.substr(eq + 1);
                    has_inline = true;
                }
            } else {
                auto it = short_map_.find(arg[1]);
                if (it == short_map_.end()) {
                    unknown_flags_.push_back(arg);
                    continue;
                }
                key = it->second;
                if (arg.size() > 2) {
                    inline_val = arg.substr(arg[2] == '=' ? 3 : 2);
                    has_inline = true;
                }
            }
            if (!value_flags_.count(key)) {
                record(key, has_inline ? &inline_val : nullptr);
                continue;
            }
            if (has_inline) {
                record(key, &inline_val);
            } else if (i + 1 < argc) {
                std::string val = argv[++i];
                record(key, &val);
            } else {
                missing_values_.push_back(key);
                record(key, nullptr);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value options that appeared last on the command line without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
