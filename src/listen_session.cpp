#include "listen_session.hpp"

#include "host_notifier.hpp"
#include "utils.hpp"

#include <chrono>
#include <utility>

namespace {

OrchestratorConfig orchestrator_config(std::vector<std::string> wake_words, const SessionConfig& cfg) {
    OrchestratorConfig out;
    out.wake_words = std::move(wake_words);
    out.passive_window_samples = window_samples(cfg.passive_window_ms, cfg.guard_samples);
    out.active_window_samples = window_samples(cfg.active_window_ms, cfg.guard_samples);
    out.active_timeout_ms = cfg.active_timeout_ms;
    out.active_windows = cfg.active_windows;
    return out;
}

} // namespace

ListenSession::ListenSession(std::unique_ptr<AudioSource> source,
                             std::unique_ptr<InferenceService> model,
                             std::vector<std::string> wake_words,
                             const SessionConfig& cfg,
                             HostNotifier* notifier)
    : cfg_(cfg),
      source_(std::move(source)),
      notifier_(notifier),
      channel_(cfg.channel_capacity),
      orchestrator_(std::move(model), orchestrator_config(std::move(wake_words), cfg)),
      normalizer_(kTargetSampleRate),
      accumulator_(orchestrator_.window_size()) {
    if (!source_) {
        throw DeviceError(DeviceErrorKind::Unavailable, "No audio source");
    }
    orchestrator_.on_transcript([this](const std::string& text) {
        if (notifier_) notifier_->post(text);
    });
}

ListenSession::~ListenSession() {
    stop();
    if (source_) source_->stop();
}

std::string ListenSession::run() {
    if (running_.exchange(true)) {
        throw MurmurError("ListenSession::run is already active");
    }
    using Clock = std::chrono::steady_clock;

    try {
        orchestrator_.begin();
    } catch (...) {
        running_ = false;
        throw;
    }

    try {
        source_->start(
            [this](AudioFrame&& frame) { channel_.try_send(std::move(frame)); },
            [this](const DeviceError& e) {
                {
                    std::lock_guard<std::mutex> lock(device_error_mutex_);
                    if (!device_error_) device_error_ = std::make_unique<DeviceError>(e);
                }
                channel_.close();
            });
    } catch (const DeviceError& e) {
        orchestrator_.fail(std::string("audio source failed to start: ") + e.what());
        shutdown();
        throw;
    }

    const auto poll = std::chrono::milliseconds(cfg_.poll_interval_ms ? cfg_.poll_interval_ms : 1);
    const auto deadline = Clock::now() + std::chrono::milliseconds(cfg_.listen_duration_ms);
    log_info("Session", "Listening" +
                            (cfg_.listen_duration_ms ? " for " + std::to_string(cfg_.listen_duration_ms) + " ms"
                                                     : std::string(" until stopped")));

    try {
        AudioFrame frame;
        while (!stop_requested_) {
            const ListenState current = orchestrator_.state();
            if (current == ListenState::Stopped) break;
            if (cfg_.listen_duration_ms > 0 && Clock::now() >= deadline &&
                current != ListenState::ActiveTranscribing) {
                log_debug("Session", "listen duration elapsed");
                break;
            }

            const ReceiveStatus status = channel_.receive(frame, poll);
            if (status == ReceiveStatus::Closed) break;
            if (status == ReceiveStatus::Item) {
                handle_frame(frame);
            }
            orchestrator_.tick(Clock::now());
            drain_windows();
            report_drops();
        }
    } catch (...) {
        shutdown();
        throw;
    }

    std::unique_ptr<DeviceError> device_error;
    {
        std::lock_guard<std::mutex> lock(device_error_mutex_);
        device_error = std::move(device_error_);
    }
    if (device_error) {
        orchestrator_.fail(std::string("audio stream terminated: ") + device_error->what());
    }
    shutdown();

    if (device_error) {
        throw *device_error;
    }
    if (!released_model_ && !orchestrator_.last_error().empty()) {
        throw InferenceError(orchestrator_.last_error(), true);
    }
    return orchestrator_.transcript();
}

void ListenSession::handle_frame(const AudioFrame& frame) {
    NormalizeResult normalized;
    try {
        normalized = normalizer_.normalize(frame);
    } catch (const ConfigError& e) {
        log_warn("Session", std::string("skipping frame: ") + e.what());
        return;
    }
    if (normalized.dropped_tail > 0) {
        dropped_tail_samples_ += normalized.dropped_tail;
        log_warn("Session", "dropped " + std::to_string(normalized.dropped_tail) +
                                " samples of an incomplete trailing frame");
    }
    accumulator_.append(normalized.samples);
    drain_windows();
}

void ListenSession::drain_windows() {
    std::vector<float> window;
    accumulator_.set_window_size(orchestrator_.window_size());
    while (!stop_requested_ && orchestrator_.state() != ListenState::Stopped && accumulator_.next_window(window)) {
        orchestrator_.process_window(window);
        // The next window is cut at the size of whatever phase we are in now.
        accumulator_.set_window_size(orchestrator_.window_size());
    }
}

void ListenSession::report_drops() {
    const std::size_t dropped = channel_.dropped();
    if (dropped != reported_drops_) {
        log_warn("Session", "consumer fell behind, " + std::to_string(dropped - reported_drops_) +
                                " frames dropped (" + std::to_string(dropped) + " total)");
        reported_drops_ = dropped;
    }
}

void ListenSession::shutdown() {
    source_->stop();
    channel_.close();
    report_drops();
    if (accumulator_.buffered() > 0) {
        log_debug("Session", "discarding " + std::to_string(accumulator_.buffered()) + " samples of a partial window");
        accumulator_.reset();
    }
    released_model_ = orchestrator_.stop();
    running_ = false;
    log_info("Session", "Stopped after " + std::to_string(orchestrator_.windows_processed()) + " windows");
}

void ListenSession::stop() {
    stop_requested_ = true;
    channel_.close();
}

std::unique_ptr<InferenceService> ListenSession::release_model() {
    if (running_) {
        throw MurmurError("ListenSession::release_model called while running");
    }
    return std::move(released_model_);
}
