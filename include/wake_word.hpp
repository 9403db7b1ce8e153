#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Offsets are byte offsets into the lowercased transcript, end exclusive.
struct WakeWordDetection {
    bool detected = false;
    std::optional<uint64_t> start_idx;
    std::optional<uint64_t> end_idx;

    bool operator==(const WakeWordDetection& other) const {
        return detected == other.detected && start_idx == other.start_idx && end_idx == other.end_idx;
    }
    bool operator!=(const WakeWordDetection& other) const { return !(*this == other); }
};

// Wake words are tried in list order and the first one found anywhere in the
// transcript wins, even when a later word appears earlier in the text. ASCII
// letters compare case-insensitively; empty wake words never match.
WakeWordDetection detect_wake_word(const std::string& transcript, const std::vector<std::string>& wake_words);

std::string join_segments(const std::vector<std::string>& segments);
