#pragma once

#include <functional>
#include <string>
#include <fmt/format.h>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

// A sink receives every record at or above the current level.
using LogSink = std::function<void(LogLevel, const std::string&)>;

// Default sink path: <tmp>/jumpline_debug.log unless configured otherwise.
std::string jl_log_path();
void set_log_file(const std::string& path);

void set_log_level(LogLevel level);
LogLevel log_level();

// Replace the sink (nullptr restores the file sink).
void set_log_sink(LogSink sink);

// Parse "debug" / "info" / "warning" / "error". Unknown names map to INFO.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

void jl_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { jl_log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) { jl_log(LogLevel::INFO, msg); }
inline void log_warning(const std::string& msg) { jl_log(LogLevel::WARNING, msg); }
inline void log_error(const std::string& msg) { jl_log(LogLevel::ERROR, msg); }
