#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex log_mutex;
std::filesystem::path log_path;
LogLevel min_level = LogLevel::Info;
LogSink sink;

}

std::filesystem::path default_log_path() {
    return platform::temp_dir() / LOG_FILE_NAME;
}

void set_log_file(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_path = path;
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    min_level = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(log_mutex);
    return min_level;
}

Result<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    if (lower == "debug") return Result<LogLevel>::Ok(LogLevel::Debug);
    if (lower == "info") return Result<LogLevel>::Ok(LogLevel::Info);
    if (lower == "warn" || lower == "warning") return Result<LogLevel>::Ok(LogLevel::Warn);
    if (lower == "error") return Result<LogLevel>::Ok(LogLevel::Error);
    return Result<LogLevel>::Err("Unknown log level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

void set_log_sink(LogSink s) {
    std::lock_guard<std::mutex> lock(log_mutex);
    sink = std::move(s);
}

void fleet_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (sink) {
        sink(level, msg);
        return;
    }
    if (level < min_level) return;

    if (log_path.empty()) log_path = default_log_path();
    std::ofstream out(log_path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    out << fmt::format("[{}] {:<5} {}\n", ts, log_level_name(level), msg);
}
