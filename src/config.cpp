#include "config.hpp"

#include "utils.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace {

template <typename T>
void read_unsigned(const char* name, T& target) {
    const char* raw = std::getenv(name);
    if (!raw || !*raw) return;

    try {
        std::size_t used = 0;
        unsigned long long value = std::stoull(raw, &used);
        if (used != std::string(raw).size() || value > std::numeric_limits<T>::max() || raw[0] == '-') {
            throw std::invalid_argument(raw);
        }
        target = static_cast<T>(value);
    } catch (const std::exception&) {
        log_warn("Config", std::string("ignoring ") + name + "=\"" + raw + "\", expected an unsigned integer");
    }
}

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

std::string env_or(const char* name, const std::string& fallback) {
    const char* raw = std::getenv(name);
    return (raw && *raw) ? std::string(raw) : fallback;
}

AudioConfig load_audio_config() {
    AudioConfig cfg;
    cfg.device = env_or("MURMUR_AUDIO_DEVICE", cfg.device);
    read_unsigned("MURMUR_CAPTURE_RATE", cfg.sample_rate);
    read_unsigned("MURMUR_CAPTURE_CHANNELS", cfg.channels);
    read_unsigned("MURMUR_FRAMES_PER_BUFFER", cfg.frames_per_buffer);
    return cfg;
}

SessionConfig load_session_config() {
    SessionConfig cfg;
    read_unsigned("MURMUR_PASSIVE_WINDOW_MS", cfg.passive_window_ms);
    read_unsigned("MURMUR_ACTIVE_WINDOW_MS", cfg.active_window_ms);
    read_unsigned("MURMUR_ACTIVE_TIMEOUT_MS", cfg.active_timeout_ms);
    read_unsigned("MURMUR_ACTIVE_WINDOWS", cfg.active_windows);
    read_unsigned("MURMUR_GUARD_SAMPLES", cfg.guard_samples);
    read_unsigned("MURMUR_CHANNEL_CAPACITY", cfg.channel_capacity);
    return cfg;
}

void apply_log_level_from_env() {
    const std::string raw = env_or("MURMUR_LOG_LEVEL", "");
    if (raw.empty()) return;

    LogLevel level;
    if (parse_log_level(raw, level)) {
        set_log_level(level);
    } else {
        log_warn("Config", "ignoring MURMUR_LOG_LEVEL=\"" + raw + "\"");
    }
}

std::vector<std::string> parse_wake_words(const std::string& text) {
    std::vector<std::string> words;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        std::string word = trim(text.substr(start, comma - start));
        if (!word.empty()) words.push_back(word);
        start = comma + 1;
    }
    return words;
}
