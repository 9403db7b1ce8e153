#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

class DeviceError;

struct AudioConfig {
    unsigned sample_rate = 16000;          // requested rate, the driver may adjust it
    unsigned channels = 1;                 // mono by default
    unsigned frames_per_buffer = 512;      // frames per capture period
    std::string device = "default";        // ALSA device name or default input
};

// Interleaved float samples from one capture period.
struct AudioFrame {
    std::vector<float> samples;
    unsigned channels = 1;
    unsigned sample_rate = 16000;
};

class AudioSource {
public:
    using SampleCallback = std::function<void(AudioFrame&&)>;
    using ErrorCallback = std::function<void(const DeviceError&)>;

    virtual ~AudioSource() = default;

    // on_samples runs on the capture thread; it must not block.
    // on_error is called at most once and the stream is dead afterwards.
    virtual void start(SampleCallback on_samples, ErrorCallback on_error) = 0;
    virtual void stop() = 0;
};

class AudioCapture : public AudioSource {
public:
    explicit AudioCapture(const AudioConfig& cfg);
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void start(SampleCallback on_samples, ErrorCallback on_error) override;
    void stop() override;

    static void list_devices();

private:
    struct Impl;
    Impl* impl_;
};
