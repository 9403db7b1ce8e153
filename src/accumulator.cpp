#include "accumulator.hpp"

#include "errors.hpp"
#include "normalizer.hpp"

#include <string>
#include <utility>

std::size_t window_samples(unsigned duration_ms, std::size_t guard_samples) {
    const std::size_t seconds = duration_ms / 1000;
    const std::size_t samples = seconds * kTargetSampleRate + guard_samples;
    if (samples == 0) {
        throw ConfigError("window of " + std::to_string(duration_ms) + " ms with " + std::to_string(guard_samples) +
                          " guard samples is empty");
    }
    return samples;
}

Accumulator::Accumulator(std::size_t window_size) : window_size_(window_size) {
    if (window_size_ == 0) {
        throw ConfigError("Accumulator: window size must be positive");
    }
    buffer_.reserve(window_size_);
}

void Accumulator::append(const std::vector<float>& chunk) {
    buffer_.insert(buffer_.end(), chunk.begin(), chunk.end());
}

bool Accumulator::next_window(std::vector<float>& out) {
    if (buffer_.size() < window_size_) return false;

    const auto split = buffer_.begin() + static_cast<std::ptrdiff_t>(window_size_);
    out.assign(buffer_.begin(), split);
    buffer_.erase(buffer_.begin(), split);
    return true;
}

std::vector<std::vector<float>> Accumulator::push(const std::vector<float>& chunk) {
    append(chunk);

    std::vector<std::vector<float>> windows;
    std::vector<float> window;
    while (next_window(window)) {
        windows.push_back(std::move(window));
        window = {};
    }
    return windows;
}

void Accumulator::set_window_size(std::size_t window_size) {
    if (window_size == 0) {
        throw ConfigError("Accumulator: window size must be positive");
    }
    window_size_ = window_size;
}

std::vector<float> Accumulator::drain() {
    std::vector<float> out;
    out.swap(buffer_);
    buffer_.reserve(window_size_);
    return out;
}

void Accumulator::reset() { buffer_.clear(); }
