#include "log.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <fmt/format.h>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;
LogLevel g_log_level = LogLevel::Info;

std::string default_log_path() {
    return (platform::temp_dir() / DEBUG_LOG_FILE_NAME).string();
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

void init_logging(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = config.path.empty() ? default_log_path() : config.path;
    g_log_level = parse_log_level(config.level);
}

std::string debug_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) g_log_path = default_log_path();
    return g_log_path;
}

void mcp_log(LogLevel level, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_log_level) return;
    if (g_log_path.empty()) g_log_path = default_log_path();

    std::ofstream out(g_log_path, std::ios::app);
    if (!out) return;

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

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {:<5} [{}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), log_level_name(level), tag, msg);
}
