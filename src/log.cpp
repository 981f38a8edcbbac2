#include "storyline/log.hpp"

#include <iostream>
#include <mutex>

namespace storyline {

namespace {

std::mutex &sink_mutex() {
    static std::mutex m;
    return m;
}

void default_sink(LogLevel level, const std::string &msg) {
    if (level == LogLevel::Info) {
        std::cout << "[INFO] " << msg << std::endl;
    } else {
        std::cerr << "[" << log_level_name(level) << "] " << msg << std::endl;
    }
}

LogSink &current_sink() {
    static LogSink sink = default_sink;
    return sink;
}

LogLevel &current_level() {
    static LogLevel level = LogLevel::Info;
    return level;
}

void write(LogLevel level, const std::string &msg) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    if (static_cast<int>(level) < static_cast<int>(current_level()))
        return;
    current_sink()(level, msg);
}

} // namespace

void set_log_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_sink() = sink ? std::move(sink) : LogSink(default_sink);
}

void reset_log_sink() { set_log_sink(nullptr); }

void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(sink_mutex());
    current_level() = level;
}

LogLevel log_level() {
    std::lock_guard<std::mutex> lock(sink_mutex());
    return current_level();
}

void log_info(const std::string &msg) { write(LogLevel::Info, msg); }
void log_warning(const std::string &msg) { write(LogLevel::Warning, msg); }
void log_error(const std::string &msg) { write(LogLevel::Error, msg); }

const char *log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "?";
}

} // namespace storyline
