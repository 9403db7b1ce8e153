#pragma once

#include <cstdint>
#include <string>
#include <vector>

float rms(const std::vector<float>& x);
float dbfs(const std::vector<float>& x);

enum class LogLevel { Trace = 0, Debug, Info, Warn, Error, Off };

void set_log_level(LogLevel level);
LogLevel log_level();
bool log_enabled(LogLevel level);

// Parses "trace", "debug", "info", "warn", "error", "off" or a digit 0-5.
bool parse_log_level(const std::string& text, LogLevel& out);

// Writes "[tag] text" as one line. Info and below go to stdout, warnings and
// errors to stderr.
void log_line(LogLevel level, const char* tag, const std::string& text);

inline void log_trace(const char* tag, const std::string& text) { log_line(LogLevel::Trace, tag, text); }
inline void log_debug(const char* tag, const std::string& text) { log_line(LogLevel::Debug, tag, text); }
inline void log_info(const char* tag, const std::string& text) { log_line(LogLevel::Info, tag, text); }
inline void log_warn(const char* tag, const std::string& text) { log_line(LogLevel::Warn, tag, text); }
inline void log_error(const char* tag, const std::string& text) { log_line(LogLevel::Error, tag, text); }

std::string to_lower_ascii(const std::string& text);
