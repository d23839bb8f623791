#pragma once
#include <functional>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

using LogSink = std::function<void(LogLevel level, const std::string& tag, const std::string& msg)>;

LogLevel parse_log_level(const std::string& name);
void set_log_level(LogLevel level);
LogLevel log_level();

// Replaces the stderr writer; an empty sink restores it.
void set_log_sink(LogSink sink);

void log_msg(LogLevel level, const std::string& tag, const std::string& msg);
inline void log_debug(const std::string& tag, const std::string& msg) { log_msg(LogLevel::Debug, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg) { log_msg(LogLevel::Info, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg) { log_msg(LogLevel::Warn, tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { log_msg(LogLevel::Error, tag, msg); }
