#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

struct LogState {
    std::mutex mutex;
    std::string path;
    LogLevel level = LogLevel::INFO;
    LogSink sink;
};

LogState& state() {
    static LogState s;
    return s;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()));
}

void write_to_file(const std::string& path, LogLevel level, const std::string& msg) {
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << "[" << timestamp() << "] " << log_level_name(level) << " " << msg << "\n";
}

} // namespace

std::string jl_log_path() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.path.empty()) {
        s.path = (platform::temp_dir() / DEFAULT_LOG_NAME).string();
    }
    return s.path;
}

void set_log_file(const std::string& path) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.path = path;
}

void set_log_level(LogLevel level) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

LogLevel log_level() {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

void set_log_sink(LogSink sink) {
    auto& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.sink = std::move(sink);
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "warning" || name == "warn") return LogLevel::WARNING;
    if (name == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

void jl_log(LogLevel level, const std::string& msg) {
    std::string path = jl_log_path();

    LogSink sink;
    {
        auto& s = state();
        std::lock_guard<std::mutex> lock(s.mutex);
        if (level < s.level) return;
        sink = s.sink;
    }

    if (sink) {
        sink(level, msg);
        return;
    }
    write_to_file(path, level, msg);
}
