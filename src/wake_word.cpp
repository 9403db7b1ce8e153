#include "wake_word.hpp"

#include "utils.hpp"

WakeWordDetection detect_wake_word(const std::string& transcript, const std::vector<std::string>& wake_words) {
    WakeWordDetection result;
    const std::string lowered = to_lower_ascii(transcript);

    for (const auto& word : wake_words) {
        if (word.empty()) continue;

        const auto pos = lowered.find(to_lower_ascii(word));
        if (pos != std::string::npos) {
            result.detected = true;
            result.start_idx = static_cast<uint64_t>(pos);
            result.end_idx = static_cast<uint64_t>(pos + word.size());
            return result;
        }
    }
    return result;
}

std::string join_segments(const std::vector<std::string>& segments) {
    std::string text;
    for (const auto& segment : segments) {
        text += segment;
    }
    return text;
}
