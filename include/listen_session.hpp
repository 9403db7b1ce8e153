#pragma once

#include "accumulator.hpp"
#include "audio_capture.hpp"
#include "errors.hpp"
#include "frame_channel.hpp"
#include "inference.hpp"
#include "normalizer.hpp"
#include "orchestrator.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class HostNotifier;

struct SessionConfig {
    unsigned listen_duration_ms = 0;       // 0 runs until stop()
    unsigned passive_window_ms = 1000;
    unsigned active_window_ms = 3000;
    std::size_t guard_samples = kDefaultGuardSamples;
    unsigned active_timeout_ms = 5000;
    unsigned active_windows = 1;
    std::size_t channel_capacity = 64;     // frames queued behind a busy consumer
    unsigned poll_interval_ms = 50;
};

// One listening session: capture thread -> FrameChannel -> this thread
// (normalize, accumulate, orchestrate).
class ListenSession {
public:
    ListenSession(std::unique_ptr<AudioSource> source,
                  std::unique_ptr<InferenceService> model,
                  std::vector<std::string> wake_words,
                  const SessionConfig& cfg,
                  HostNotifier* notifier = nullptr);
    ~ListenSession();

    ListenSession(const ListenSession&) = delete;
    ListenSession& operator=(const ListenSession&) = delete;

    // Blocks until the listen duration passes, stop() is called, the device
    // fails or the model becomes unusable. Returns the session transcript.
    // Throws DeviceError if the source could not start or died mid-stream.
    std::string run();

    // Safe from any thread.
    void stop();

    // Only valid once run() has returned.
    std::unique_ptr<InferenceService> release_model();

    ListenState state() const { return orchestrator_.state(); }
    const Orchestrator& orchestrator() const { return orchestrator_; }
    std::size_t dropped_frames() const { return channel_.dropped(); }
    std::size_t dropped_tail_samples() const { return dropped_tail_samples_; }

private:
    void handle_frame(const AudioFrame& frame);
    void drain_windows();
    void report_drops();
    void shutdown();

    SessionConfig cfg_;
    std::unique_ptr<AudioSource> source_;
    HostNotifier* notifier_;
    FrameChannel<AudioFrame> channel_;
    Orchestrator orchestrator_;
    Normalizer normalizer_;
    Accumulator accumulator_;
    std::unique_ptr<InferenceService> released_model_;

    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> running_{false};
    std::mutex device_error_mutex_;
    std::unique_ptr<DeviceError> device_error_;

    std::size_t dropped_tail_samples_{0};
    std::size_t reported_drops_{0};
};
