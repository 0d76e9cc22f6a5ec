#include "storage/log.hpp"

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

log_callback_t make_stream_logger(std::ostream& out, LogLevel min_level) {
    return [&out, min_level](LogLevel level, const std::string& msg) {
        if (static_cast<int>(level) < static_cast<int>(min_level)) {
            return;
        }
        out << "[" << to_string(level) << "] " << msg << std::endl;
    };
}
