#pragma once

#include <cstddef>
#include <vector>

constexpr std::size_t kDefaultGuardSamples = 200;

// floor(duration_ms / 1000) * 16000 + guard_samples. Throws ConfigError when
// the result is zero.
std::size_t window_samples(unsigned duration_ms, std::size_t guard_samples = kDefaultGuardSamples);

// Cuts a continuous stream of chunks into windows of exactly window_size()
// samples. Everything pushed comes out once, in order: the emitted windows
// followed by remainder().
class Accumulator {
public:
    explicit Accumulator(std::size_t window_size);

    void append(const std::vector<float>& chunk);

    // Splits one window off the front if enough samples are buffered.
    bool next_window(std::vector<float>& out);

    // append() followed by every window that is now complete, oldest first.
    std::vector<std::vector<float>> push(const std::vector<float>& chunk);

    // Applies to the next window split off; buffered samples are kept.
    void set_window_size(std::size_t window_size);
    std::size_t window_size() const { return window_size_; }

    const std::vector<float>& remainder() const { return buffer_; }
    std::size_t buffered() const { return buffer_.size(); }

    std::vector<float> drain();
    void reset();

private:
    std::size_t window_size_;
    std::vector<float> buffer_;
};
