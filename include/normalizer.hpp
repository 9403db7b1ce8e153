#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

struct AudioFrame;

constexpr unsigned kTargetSampleRate = 16000;

std::vector<float> int16_to_float(const int16_t* data, std::size_t samples);

// Averages each group of `channels` interleaved samples into one. A trailing
// group shorter than `channels` is dropped and its size written to
// `dropped_tail` when given.
std::vector<float> downmix(const std::vector<float>& interleaved, unsigned channels,
                           std::size_t* dropped_tail = nullptr);

// Blackman-windowed sinc resampler. Equal rates return the input unchanged.
std::vector<float> resample(const std::vector<float>& mono, unsigned source_rate, unsigned target_rate);

struct NormalizeResult {
    std::vector<float> samples;      // mono, kTargetSampleRate
    std::size_t dropped_tail = 0;    // samples lost to an incomplete trailing frame
};

// Stateless: each frame is converted on its own.
class Normalizer {
public:
    explicit Normalizer(unsigned target_rate = kTargetSampleRate);

    NormalizeResult normalize(const AudioFrame& frame) const;

    unsigned target_rate() const { return target_rate_; }

private:
    unsigned target_rate_;
};
