#pragma once

#include <functional>
#include <string>

namespace storyline {

// ─── Logging ────────────────────────────────────────────────────────────────

enum class LogLevel {
    Info,
    Warning,
    Error,
};

// Receives every message at or above the current level.
using LogSink = std::function<void(LogLevel, const std::string &)>;

// Default sink: [INFO] lines to stdout, [WARN] / [ERROR] lines to stderr.
void set_log_sink(LogSink sink);
void reset_log_sink();

// Messages below this level are dropped before reaching the sink.
void set_log_level(LogLevel level);
LogLevel log_level();

void log_info(const std::string &msg);
void log_warning(const std::string &msg);
void log_error(const std::string &msg);

const char *log_level_name(LogLevel level);

} // namespace storyline
