#pragma once
#include <functional>
#include <ostream>
#include <string>

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

const char* to_string(LogLevel level);

// An empty callback disables logging.
typedef std::function<void(LogLevel, const std::string&)> log_callback_t;

// Writes "[level] message" lines to `out` for every message at or above
// `min_level`. The stream must outlive the returned callback.
log_callback_t make_stream_logger(std::ostream& out, LogLevel min_level = LogLevel::Info);
