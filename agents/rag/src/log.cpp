#include "../include/log.hpp"
#include "../include/util.hpp"
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace {
std::mutex g_log_mtx;
LogLevel g_level = LogLevel::Info;
LogSink g_sink;

const char* level_prefix(LogLevel level) {
    switch (level) {
        case LogLevel::Warn: return "WARNING: ";
        case LogLevel::Error: return "ERROR: ";
        default: return "";
    }
}
}

LogLevel parse_log_level(const std::string& name) {
    auto n = to_lower(trim(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    throw std::invalid_argument("unknown log level: '" + name + "'");
}

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    g_level = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    return g_level;
}

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_log_mtx);
    g_sink = std::move(sink);
}

void log_msg(LogLevel level, const std::string& tag, const std::string& msg) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(g_log_mtx);
        if (level < g_level) return;
        if (!g_sink) {
            std::cerr << "[" << tag << "] " << level_prefix(level) << msg << std::endl;
            return;
        }
        sink = g_sink;
    }
    // called unlocked so a sink may log itself
    sink(level, tag, msg);
}
