#include "utils.hpp"

#include <atomic>
#include <cctype>
#include <cmath>
#include <iostream>
#include <mutex>

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_log_mutex;

const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off: return "off";
    }
    return "?";
}

} // namespace

float rms(const std::vector<float>& x) {
    if (x.empty()) return 0.0f;
    double acc = 0.0;
    for (auto sample : x) {
        acc += static_cast<double>(sample) * static_cast<double>(sample);
    }
    double mean = acc / static_cast<double>(x.size());
    return static_cast<float>(std::sqrt(mean));
}

float dbfs(const std::vector<float>& x) {
    const float r = rms(x);
    return 20.0f * std::log10(r + 1e-9f); // full scale is 1.0 for float samples
}

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

bool log_enabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

bool parse_log_level(const std::string& text, LogLevel& out) {
    const std::string lowered = to_lower_ascii(text);
    if (lowered.size() == 1 && lowered[0] >= '0' && lowered[0] <= '5') {
        out = static_cast<LogLevel>(lowered[0] - '0');
        return true;
    }
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        if (lowered == level_name(level)) {
            out = level;
            return true;
        }
    }
    if (lowered == "warning") {
        out = LogLevel::Warn;
        return true;
    }
    return false;
}

void log_line(LogLevel level, const char* tag, const std::string& text) {
    if (!log_enabled(level)) return;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& os = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    os << "[" << tag << "] ";
    if (level == LogLevel::Warn) os << "Warning: ";
    if (level == LogLevel::Error) os << "Error: ";
    os << text << "\n";
    if (level >= LogLevel::Warn) os.flush();
}

std::string to_lower_ascii(const std::string& text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}
