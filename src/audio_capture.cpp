#include "audio_capture.hpp"

#include "errors.hpp"
#include "normalizer.hpp"
#include "utils.hpp"

#include <iostream>
#include <string>
#include <vector>

#if defined(__linux__)

#include <alsa/asoundlib.h>
#include <atomic>
#include <cstdio>
#include <sstream>
#include <thread>

namespace {

std::string alsa_error(int code, const std::string& context) {
    std::ostringstream oss;
    oss << context << ": " << snd_strerror(code);
    return oss.str();
}

struct HwParamsGuard {
    snd_pcm_hw_params_t* params{nullptr};
    ~HwParamsGuard() {
        if (params) snd_pcm_hw_params_free(params);
    }
};

} // namespace

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig& cfg);
    ~Impl();

    void start(SampleCallback on_samples, ErrorCallback on_error);
    void stop();
    static void list_devices();

private:
    void open_device();
    void capture_loop();
    void close_device();

    AudioConfig cfg_;
    snd_pcm_t* handle_{nullptr};
    std::thread thread_;
    std::atomic<bool> running_{false};
    SampleCallback on_samples_;
    ErrorCallback on_error_;
};

AudioCapture::Impl::Impl(const AudioConfig& cfg) : cfg_(cfg) {}

AudioCapture::Impl::~Impl() { stop(); }

void AudioCapture::Impl::open_device() {
    int err = snd_pcm_open(&handle_, cfg_.device.c_str(), SND_PCM_STREAM_CAPTURE, 0);
    if (err < 0) {
        handle_ = nullptr;
        throw DeviceError(DeviceErrorKind::Unavailable, alsa_error(err, "snd_pcm_open(" + cfg_.device + ")"));
    }

    HwParamsGuard hw;
    snd_pcm_hw_params_malloc(&hw.params);
    if (!hw.params) {
        close_device();
        throw DeviceError(DeviceErrorKind::ConfigUnsupported, "Failed to allocate ALSA hw params");
    }

    auto check = [&](int code, const char* what) {
        if (code < 0) {
            close_device();
            throw DeviceError(DeviceErrorKind::ConfigUnsupported, alsa_error(code, what));
        }
    };

    check(snd_pcm_hw_params_any(handle_, hw.params), "snd_pcm_hw_params_any");
    check(snd_pcm_hw_params_set_access(handle_, hw.params, SND_PCM_ACCESS_RW_INTERLEAVED),
          "snd_pcm_hw_params_set_access");
    check(snd_pcm_hw_params_set_format(handle_, hw.params, SND_PCM_FORMAT_S16_LE),
          "snd_pcm_hw_params_set_format");
    check(snd_pcm_hw_params_set_channels(handle_, hw.params, cfg_.channels),
          "snd_pcm_hw_params_set_channels");

    unsigned int rate = cfg_.sample_rate;
    check(snd_pcm_hw_params_set_rate_near(handle_, hw.params, &rate, nullptr),
          "snd_pcm_hw_params_set_rate_near");
    if (rate != cfg_.sample_rate) {
        log_warn("Capture", "sample rate adjusted to " + std::to_string(rate) + " Hz");
        cfg_.sample_rate = rate;
    }

    snd_pcm_uframes_t frames = cfg_.frames_per_buffer;
    check(snd_pcm_hw_params_set_period_size_near(handle_, hw.params, &frames, nullptr),
          "snd_pcm_hw_params_set_period_size_near");
    cfg_.frames_per_buffer = static_cast<unsigned>(frames);

    check(snd_pcm_hw_params(handle_, hw.params), "snd_pcm_hw_params");
    check(snd_pcm_prepare(handle_), "snd_pcm_prepare");

    log_info("Capture", "Opened " + cfg_.device + " at " + std::to_string(cfg_.sample_rate) + " Hz, " +
                            std::to_string(cfg_.channels) + "ch, " + std::to_string(cfg_.frames_per_buffer) +
                            " frames per period");
}

void AudioCapture::Impl::close_device() {
    if (handle_) {
        snd_pcm_drop(handle_);
        snd_pcm_close(handle_);
        handle_ = nullptr;
    }
}

void AudioCapture::Impl::start(SampleCallback on_samples, ErrorCallback on_error) {
    if (running_) return;
    if (cfg_.channels == 0 || cfg_.frames_per_buffer == 0) {
        throw DeviceError(DeviceErrorKind::ConfigUnsupported, "Invalid channel count or frames_per_buffer for capture");
    }

    open_device();

    on_samples_ = std::move(on_samples);
    on_error_ = std::move(on_error);
    running_ = true;
    thread_ = std::thread(&Impl::capture_loop, this);
}

void AudioCapture::Impl::capture_loop() {
    const std::size_t period = cfg_.frames_per_buffer;
    std::vector<int16_t> raw(period * cfg_.channels);

    while (running_) {
        snd_pcm_sframes_t frames = snd_pcm_readi(handle_, raw.data(), period);
        if (frames < 0) {
            frames = snd_pcm_recover(handle_, static_cast<int>(frames), 1);
        }
        if (frames < 0) {
            running_ = false;
            if (on_error_) {
                on_error_(DeviceError(DeviceErrorKind::StreamFailed,
                                      alsa_error(static_cast<int>(frames), "snd_pcm_readi")));
            }
            return;
        }
        if (frames == 0) continue;

        AudioFrame frame;
        frame.channels = cfg_.channels;
        frame.sample_rate = cfg_.sample_rate;
        frame.samples = int16_to_float(raw.data(), static_cast<std::size_t>(frames) * cfg_.channels);
        on_samples_(std::move(frame));
    }
}

void AudioCapture::Impl::stop() {
    running_ = false;
    if (thread_.joinable()) {
        // snd_pcm_drop wakes a blocked snd_pcm_readi only on some drivers, so the
        // loop is allowed to finish its current period first.
        thread_.join();
    }
    close_device();
}

void AudioCapture::Impl::list_devices() {
    int card = -1;
    if (snd_card_next(&card) < 0 || card < 0) {
        std::cout << "No ALSA capture devices found.\n";
        return;
    }

    std::cout << "ALSA capture devices (use \"plughw:x,y\" in MURMUR_AUDIO_DEVICE):\n";
    while (card >= 0) {
        snd_ctl_t* ctl = nullptr;
        char card_name[32];
        std::snprintf(card_name, sizeof(card_name), "hw:%d", card);
        if (snd_ctl_open(&ctl, card_name, 0) < 0) {
            snd_card_next(&card);
            continue;
        }

        snd_pcm_info_t* pcm_info = nullptr;
        snd_pcm_info_malloc(&pcm_info);
        if (!pcm_info) {
            std::cout << "  (Failed to allocate pcm_info)\n";
            snd_ctl_close(ctl);
            snd_card_next(&card);
            continue;
        }

        int device = -1;
        while (snd_ctl_pcm_next_device(ctl, &device) >= 0 && device >= 0) {
            snd_pcm_info_set_device(pcm_info, device);
            snd_pcm_info_set_subdevice(pcm_info, 0);
            snd_pcm_info_set_stream(pcm_info, SND_PCM_STREAM_CAPTURE);

            if (snd_ctl_pcm_info(ctl, pcm_info) < 0) continue;

            const char* name = snd_pcm_info_get_name(pcm_info);
            const char* id = snd_pcm_info_get_id(pcm_info);
            std::cout << "- hw:" << card << "," << device;
            if (name) std::cout << " (" << name << ")";
            if (id) std::cout << " [" << id << "]";
            std::cout << "\n";
        }

        snd_pcm_info_free(pcm_info);
        snd_ctl_close(ctl);
        snd_card_next(&card);
    }
}

#else

struct AudioCapture::Impl {
    explicit Impl(const AudioConfig&) {}
    void start(SampleCallback, ErrorCallback) {
        throw DeviceError(DeviceErrorKind::Unavailable, "Audio capture not supported on this platform");
    }
    void stop() {}
    static void list_devices() {
        std::cout << "Audio capture not supported on this platform.\n";
    }
};

#endif

AudioCapture::AudioCapture(const AudioConfig& cfg) : impl_(new Impl(cfg)) {}

AudioCapture::~AudioCapture() { delete impl_; }

void AudioCapture::start(SampleCallback on_samples, ErrorCallback on_error) {
    impl_->start(std::move(on_samples), std::move(on_error));
}

void AudioCapture::stop() { impl_->stop(); }

void AudioCapture::list_devices() { Impl::list_devices(); }
