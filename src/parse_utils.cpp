#include "parse_utils.hpp"
#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>

static bool all_digits(const std::string& s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

unsigned int parse_uint(const std::string& value, unsigned int min, unsigned int max, bool& ok) {
    ok = false;
    if (!all_digits(value))
        return 0;
    unsigned long long v = 0;
    try {
        v = std::stoull(value);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (v < min || v > max)
        return 0;
    ok = true;
    return static_cast<unsigned int>(v);
}

size_t parse_bytes(const std::string& value, bool& ok) {
    ok = false;
    std::string val = to_lower(value);
    auto ends_with = [&](const std::string& suf) {
        return val.size() >= suf.size() &&
               val.compare(val.size() - suf.size(), suf.size(), suf) == 0;
    };
    unsigned long long mult = 1;
    if (ends_with("b"))
        val.pop_back();
    if (ends_with("k")) {
        mult = 1024ull;
        val.pop_back();
    } else if (ends_with("m")) {
        mult = 1024ull * 1024;
        val.pop_back();
    } else if (ends_with("g")) {
        mult = 1024ull * 1024 * 1024;
        val.pop_back();
    }
    if (!all_digits(val))
        return 0;
    unsigned long long base = 0;
    try {
        base = std::stoull(val);
    } catch (const std::out_of_range&) {
        return 0;
    }
    if (base > ULLONG_MAX / mult)
        return 0;
    ok = true;
    return static_cast<size_t>(base * mult);
}

bool parse_bool(const std::string& value, bool& ok) {
    std::string v = to_lower(value);
    ok = true;
    if (v.empty() || v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    ok = false;
    return false;
}
