#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static LogLevel g_min_level = LogLevel::INFO;
static size_t g_max_size = 0;
static size_t g_max_files = 1;
static bool g_json_log = false;
static bool g_compress_logs = false;
static std::mutex g_log_mtx;

bool init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    g_min_level = level;
    g_max_size = max_size;
    g_max_files = max_files;
    return true;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_min_level = level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        return LogLevel::DEBUG;
    if (val == "INFO")
        return LogLevel::INFO;
    if (val == "WARNING" || val == "WARN")
        return LogLevel::WARNING;
    if (val == "ERROR")
        return LogLevel::ERR;
    throw std::runtime_error("Invalid log level: " + name);
}

void set_json_logging(bool enable) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_json_log = enable;
}

void set_log_compression(bool enable) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    g_compress_logs = enable;
}

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

// Shift name.1..name.N up by one, dropping the oldest, then move the active
// file to name.1. Caller holds g_log_mtx and has closed the stream.
static void rotate_files() {
    std::error_code ec;
    const std::string suffix = g_compress_logs ? ".gz" : "";
    for (size_t i = g_max_files; i > 0; --i) {
        fs::path src = g_log_path + "." + std::to_string(i) + suffix;
        if (i == g_max_files) {
            fs::remove(src, ec);
        } else {
            fs::path dst = g_log_path + "." + std::to_string(i + 1) + suffix;
            fs::rename(src, dst, ec);
        }
    }
    fs::path first = g_log_path + ".1";
    fs::rename(g_log_path, first, ec);
    if (g_compress_logs) {
        fs::path gz = first;
        gz += ".gz";
        if (gzip_file(first.string(), gz.string()))
            fs::remove(first, ec);
    }
}

static const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

static std::string format_entry(LogLevel level, const std::string& msg,
                                const std::map<std::string, std::string>& fields) {
    if (g_json_log) {
        nlohmann::json j{{"timestamp", timestamp_utc()}, {"level", level_label(level)},
                         {"msg", msg}};
        for (const auto& [k, v] : fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + timestamp() + "] [" + level_label(level) + "] " + msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;
    return line;
}

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (!g_log_ofs.is_open() || level < g_min_level)
        return;
    g_log_ofs << format_entry(level, message, fields) << '\n';
    if (g_max_size == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size)
        return;
    g_log_ofs.close();
    if (g_max_files > 0)
        rotate_files();
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

void log_event(LogLevel level, const std::string& message) { log_event(level, message, {}); }

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    g_min_level = LogLevel::INFO;
    g_max_size = 0;
    g_max_files = 1;
    g_json_log = false;
    g_compress_logs = false;
}
