#pragma once

#include <string>
#include <functional>
#include <filesystem>
#include "types.hpp"

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

// Default log file: <temp>/fleetwatch.log
std::filesystem::path default_log_path();

void set_log_file(const std::filesystem::path& path);
void set_log_level(LogLevel level);
LogLevel log_level();

Result<LogLevel> parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Replace file output with a callback (used by tests to capture lines).
// Pass nullptr to go back to the log file.
using LogSink = std::function<void(LogLevel, const std::string&)>;
void set_log_sink(LogSink sink);

// Append a timestamped line to the log. Safe to call from any thread.
void fleet_log(LogLevel level, const std::string& msg);

inline void fleet_log_debug(const std::string& msg) { fleet_log(LogLevel::Debug, msg); }
inline void fleet_log_info(const std::string& msg)  { fleet_log(LogLevel::Info, msg); }
inline void fleet_log_warn(const std::string& msg)  { fleet_log(LogLevel::Warn, msg); }
inline void fleet_log_error(const std::string& msg) { fleet_log(LogLevel::Error, msg); }
