#include "normalizer.hpp"

#include "audio_capture.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kZeroCrossings = 32.0;

double sinc(double x) {
    if (std::fabs(x) < 1e-12) return 1.0;
    return std::sin(kPi * x) / (kPi * x);
}

// u in [-1, 1]
double blackman(double u) {
    return 0.42 + 0.5 * std::cos(kPi * u) + 0.08 * std::cos(2.0 * kPi * u);
}

} // namespace

std::vector<float> int16_to_float(const int16_t* data, std::size_t samples) {
    std::vector<float> out(samples);
    for (std::size_t i = 0; i < samples; ++i) {
        out[i] = static_cast<float>(data[i]) / 32768.0f;
    }
    return out;
}

std::vector<float> downmix(const std::vector<float>& interleaved, unsigned channels, std::size_t* dropped_tail) {
    if (channels == 0) {
        throw ConfigError("downmix: channel count must be positive");
    }

    const std::size_t frames = interleaved.size() / channels;
    const std::size_t tail = interleaved.size() - frames * channels;
    if (dropped_tail) *dropped_tail = tail;

    if (channels == 1) return interleaved;

    std::vector<float> mono(frames);
    for (std::size_t f = 0; f < frames; ++f) {
        const float* frame = interleaved.data() + f * channels;
        double sum = 0.0;
        for (unsigned c = 0; c < channels; ++c) {
            sum += frame[c];
        }
        mono[f] = static_cast<float>(sum / channels);
    }
    return mono;
}

std::vector<float> resample(const std::vector<float>& mono, unsigned source_rate, unsigned target_rate) {
    if (source_rate == 0 || target_rate == 0) {
        throw ConfigError("resample: sample rates must be positive");
    }
    if (source_rate == target_rate || mono.empty()) return mono;

    const double ratio = static_cast<double>(target_rate) / static_cast<double>(source_rate);
    const auto out_len = static_cast<std::size_t>(std::llround(static_cast<double>(mono.size()) * ratio));
    const double cutoff = std::min(1.0, ratio);
    const double half_width = kZeroCrossings / cutoff;
    const auto last = static_cast<long long>(mono.size()) - 1;

    std::vector<float> out(out_len);
    for (std::size_t i = 0; i < out_len; ++i) {
        const double t = static_cast<double>(i) / ratio;
        const auto lo = static_cast<long long>(std::ceil(t - half_width));
        const auto hi = static_cast<long long>(std::floor(t + half_width));

        double acc = 0.0;
        double weight_sum = 0.0;
        for (long long j = lo; j <= hi; ++j) {
            const double x = t - static_cast<double>(j);
            const double w = cutoff * sinc(cutoff * x) * blackman(x / half_width);
            const long long idx = std::min(std::max(j, 0LL), last);
            acc += w * mono[static_cast<std::size_t>(idx)];
            weight_sum += w;
        }
        out[i] = static_cast<float>(weight_sum != 0.0 ? acc / weight_sum : acc);
    }
    return out;
}

Normalizer::Normalizer(unsigned target_rate) : target_rate_(target_rate) {
    if (target_rate_ == 0) {
        throw ConfigError("Normalizer: target rate must be positive");
    }
}

NormalizeResult Normalizer::normalize(const AudioFrame& frame) const {
    if (frame.channels == 0 || frame.sample_rate == 0) {
        throw ConfigError("Normalizer: frame has " + std::to_string(frame.channels) + " channels at " +
                          std::to_string(frame.sample_rate) + " Hz");
    }

    NormalizeResult result;
    std::vector<float> mono = downmix(frame.samples, frame.channels, &result.dropped_tail);
    result.samples = resample(mono, frame.sample_rate, target_rate_);
    return result;
}
