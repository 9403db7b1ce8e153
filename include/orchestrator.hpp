#pragma once

#include "accumulator.hpp"
#include "inference.hpp"
#include "wake_word.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class ListenState {
    Idle,
    PassiveListening,
    EvaluatingWakeWord,
    ActiveTranscribing,
    Stopped,
};

const char* to_string(ListenState state);

struct OrchestratorConfig {
    std::vector<std::string> wake_words;
    std::size_t passive_window_samples = 16000 + kDefaultGuardSamples;
    std::size_t active_window_samples = 3 * 16000 + kDefaultGuardSamples;
    unsigned active_timeout_ms = 5000;
    unsigned active_windows = 1;    // windows transcribed after the wake window
};

// Drives Listen -> Detect -> Transcribe over accumulated windows. Owns the
// model for the whole session and makes at most one inference call at a time.
//
// begin/process_window/tick/stop are meant for the single consumer thread;
// the accessors may be called from anywhere.
class Orchestrator {
public:
    using Clock = std::chrono::steady_clock;
    using TranscriptCallback = std::function<void(const std::string&)>;
    using StateCallback = std::function<void(ListenState from, ListenState to)>;

    Orchestrator(std::unique_ptr<InferenceService> model, OrchestratorConfig cfg);

    void on_transcript(TranscriptCallback cb) { on_transcript_ = std::move(cb); }
    void on_state_change(StateCallback cb) { on_state_change_ = std::move(cb); }

    // Idle -> PassiveListening. Throws ModelLoadError without a model.
    void begin();

    void process_window(const std::vector<float>& window);
    void process_window(const std::vector<float>& window, Clock::time_point now);

    // Ends an active phase whose timeout has passed.
    void tick(Clock::time_point now);

    // Moves to Stopped for a reason outside inference (device loss).
    void fail(const std::string& reason);

    // Terminal. Hands back the model, or null if it was discarded.
    std::unique_ptr<InferenceService> stop();

    ListenState state() const;
    std::size_t window_size() const;
    std::string transcript() const;
    std::string last_error() const;
    WakeWordDetection last_detection() const;
    std::size_t failed_windows() const;
    std::size_t windows_processed() const;

private:
    bool infer_window(const std::vector<float>& window, DecodeStrategy strategy, std::vector<std::string>& segments);
    void transition(ListenState to);
    void deliver(const std::string& text);
    void finish_active_window();

    OrchestratorConfig cfg_;

    std::mutex model_mutex_;
    std::unique_ptr<InferenceService> model_;

    mutable std::mutex state_mutex_;
    ListenState state_{ListenState::Idle};
    std::string transcript_;
    std::string last_error_;
    WakeWordDetection last_detection_;
    std::size_t failed_windows_{0};
    std::size_t windows_processed_{0};

    Clock::time_point active_deadline_{};
    unsigned active_remaining_{0};

    TranscriptCallback on_transcript_;
    StateCallback on_state_change_;
};
