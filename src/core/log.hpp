#pragma once

#include <string>
#include <core/types.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Parse "debug" / "info" / "warn" / "error" (case-insensitive). Unknown → Info.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Point the debug log at the configured file and threshold.
// Without a call, lines go to <temp>/mcpcore_debug.log at Info.
void init_logging(const LogConfig& config);

std::string debug_log_path();

// Append "[HH:MM:SS.mmm] LEVEL [tag] msg" to the debug log.
void mcp_log(LogLevel level, const std::string& tag, const std::string& msg);

inline void log_debug(const std::string& tag, const std::string& msg) { mcp_log(LogLevel::Debug, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg)  { mcp_log(LogLevel::Info, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg)  { mcp_log(LogLevel::Warn, tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { mcp_log(LogLevel::Error, tag, msg); }
