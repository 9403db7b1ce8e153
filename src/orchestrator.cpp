#include "orchestrator.hpp"

#include "errors.hpp"
#include "utils.hpp"

#include <cctype>
#include <sstream>
#include <utility>

namespace {

std::string trim(const std::string& text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

} // namespace

const char* to_string(ListenState state) {
    switch (state) {
    case ListenState::Idle: return "Idle";
    case ListenState::PassiveListening: return "PassiveListening";
    case ListenState::EvaluatingWakeWord: return "EvaluatingWakeWord";
    case ListenState::ActiveTranscribing: return "ActiveTranscribing";
    case ListenState::Stopped: return "Stopped";
    }
    return "Unknown";
}

Orchestrator::Orchestrator(std::unique_ptr<InferenceService> model, OrchestratorConfig cfg)
    : cfg_(std::move(cfg)), model_(std::move(model)) {
    if (cfg_.passive_window_samples == 0 || cfg_.active_window_samples == 0) {
        throw ConfigError("Orchestrator: window sizes must be positive");
    }
}

void Orchestrator::begin() {
    if (state() != ListenState::Idle) {
        throw MurmurError(std::string("Orchestrator::begin called in state ") + to_string(state()));
    }
    {
        std::lock_guard<std::mutex> lock(model_mutex_);
        if (!model_) {
            throw ModelLoadError("No model loaded");
        }
    }
    if (cfg_.wake_words.empty()) {
        log_warn("Orchestrator", "no wake words configured, active transcription will never start");
    }
    transition(ListenState::PassiveListening);
}

void Orchestrator::process_window(const std::vector<float>& window) { process_window(window, Clock::now()); }

void Orchestrator::process_window(const std::vector<float>& window, Clock::time_point now) {
    ListenState current = state();
    if (current == ListenState::Stopped) return;
    if (current == ListenState::Idle) {
        throw MurmurError("Orchestrator received a window before begin()");
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++windows_processed_;
    }
    if (log_enabled(LogLevel::Debug)) {
        std::ostringstream oss;
        oss << "window of " << window.size() << " samples at " << dbfs(window) << " dBFS in " << to_string(current);
        log_debug("Orchestrator", oss.str());
    }

    tick(now);
    current = state();

    std::vector<std::string> segments;
    if (current == ListenState::ActiveTranscribing) {
        if (!infer_window(window, DecodeStrategy::Detailed, segments)) return;
        deliver(join_segments(segments));
        finish_active_window();
        return;
    }

    transition(ListenState::EvaluatingWakeWord);
    if (!infer_window(window, DecodeStrategy::Greedy, segments)) return;

    const std::string text = join_segments(segments);
    WakeWordDetection detection = detect_wake_word(text, cfg_.wake_words);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_detection_ = detection;
    }
    if (!detection.detected) {
        log_trace("Orchestrator", "no wake word in \"" + text + "\"");
        transition(ListenState::PassiveListening);
        return;
    }

    log_info("Orchestrator", "Wake word detected at " + std::to_string(*detection.start_idx) + " in \"" + text + "\"");
    active_deadline_ = now + std::chrono::milliseconds(cfg_.active_timeout_ms);
    active_remaining_ = cfg_.active_windows;
    transition(ListenState::ActiveTranscribing);

    // The wake window usually carries the start of the request.
    if (!infer_window(window, DecodeStrategy::Detailed, segments)) return;
    deliver(join_segments(segments));
    if (active_remaining_ == 0) {
        transition(ListenState::PassiveListening);
    }
}

void Orchestrator::finish_active_window() {
    if (active_remaining_ > 0) --active_remaining_;
    if (active_remaining_ == 0) {
        log_debug("Orchestrator", "active phase complete");
        transition(ListenState::PassiveListening);
    }
}

void Orchestrator::tick(Clock::time_point now) {
    if (state() != ListenState::ActiveTranscribing) return;
    if (now >= active_deadline_) {
        log_info("Orchestrator", "active transcription timed out after " + std::to_string(cfg_.active_timeout_ms) + " ms");
        active_remaining_ = 0;
        transition(ListenState::PassiveListening);
    }
}

bool Orchestrator::infer_window(const std::vector<float>& window, DecodeStrategy strategy,
                                std::vector<std::string>& segments) {
    std::string failure;
    bool fatal = false;
    try {
        std::lock_guard<std::mutex> lock(model_mutex_);
        if (!model_) {
            throw InferenceError("model handle released", true);
        }
        segments = model_->infer(window, strategy);
        return true;
    } catch (const InferenceError& e) {
        failure = e.what();
        fatal = e.fatal();
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (fatal) {
        log_error("Orchestrator", "model is unusable, stopping: " + failure);
        {
            std::lock_guard<std::mutex> lock(model_mutex_);
            model_.reset();
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            last_error_ = failure;
        }
        transition(ListenState::Stopped);
        return false;
    }

    log_warn("Orchestrator", std::string("inference (") + to_string(strategy) + ") failed, skipping window: " + failure);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++failed_windows_;
        last_error_ = failure;
    }
    active_remaining_ = 0;
    transition(ListenState::PassiveListening);
    return false;
}

void Orchestrator::deliver(const std::string& text) {
    const std::string trimmed = trim(text);
    if (trimmed.empty()) return;

    log_info("Orchestrator", "Transcript: " + trimmed);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!transcript_.empty()) transcript_ += ' ';
        transcript_ += trimmed;
    }
    if (on_transcript_) on_transcript_(trimmed);
}

void Orchestrator::fail(const std::string& reason) {
    log_error("Orchestrator", reason);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = reason;
    }
    transition(ListenState::Stopped);
}

std::unique_ptr<InferenceService> Orchestrator::stop() {
    transition(ListenState::Stopped);
    std::lock_guard<std::mutex> lock(model_mutex_);
    return std::move(model_);
}

void Orchestrator::transition(ListenState to) {
    ListenState from;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = state_;
        if (from == to || from == ListenState::Stopped) return;
        state_ = to;
    }
    log_trace("Orchestrator", std::string(to_string(from)) + " -> " + to_string(to));
    if (on_state_change_) on_state_change_(from, to);
}

ListenState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::size_t Orchestrator::window_size() const {
    return state() == ListenState::ActiveTranscribing ? cfg_.active_window_samples : cfg_.passive_window_samples;
}

std::string Orchestrator::transcript() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return transcript_;
}

std::string Orchestrator::last_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

WakeWordDetection Orchestrator::last_detection() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_detection_;
}

std::size_t Orchestrator::failed_windows() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failed_windows_;
}

std::size_t Orchestrator::windows_processed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return windows_processed_;
}
