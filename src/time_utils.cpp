#include "time_utils.hpp"
#include <chrono>
#include <ctime>

namespace {
std::string format_now(const char* fmt, bool utc) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    if (utc)
        gmtime_s(&tm, &t);
    else
        localtime_s(&tm, &t);
#else
    if (utc)
        gmtime_r(&t, &tm);
    else
        localtime_r(&t, &tm);
#endif
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf);
}
} // namespace

std::string timestamp() { return format_now("%Y-%m-%d %H:%M:%S", false); }

std::string timestamp_utc() { return format_now("%Y-%m-%dT%H:%M:%SZ", true); }
