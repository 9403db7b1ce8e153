#pragma once

#include "audio_capture.hpp"
#include "host_notifier.hpp"
#include "inference.hpp"
#include "listen_session.hpp"
#include "message_codec.hpp"
#include "message_handler.hpp"
#include "session_registry.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using AudioSourceFactory = std::function<std::unique_ptr<AudioSource>()>;

// The one process-wide object behind the C functions in murmur.h. Everything
// it hands out is an explicit object; the C layer only marshals bytes.
class Boundary {
public:
    static Boundary& instance();

    Boundary();

    // Loads the model and registers a session. Throws ModelLoadError.
    Context init_context(const std::string& model_path, std::vector<std::string> wake_words);

    // Blocks for one listening session and returns ctx with its transcript.
    Context transcribe_speech(const Context& ctx, unsigned listen_duration_ms);

    bool stop_listening(const Context& ctx);
    bool release_context(const Context& ctx);

    MessageHandler& protocol() { return protocol_; }
    SessionRegistry& sessions() { return sessions_; }

    void set_model_factory(ModelFactory factory);
    void set_audio_source_factory(AudioSourceFactory factory);
    void set_session_config(const SessionConfig& cfg);
    void set_notifier(std::shared_ptr<HostNotifier> notifier);
    std::shared_ptr<HostNotifier> notifier() const;

private:
    std::unique_ptr<InferenceService> load_model(const std::string& model_path) const;

    mutable std::mutex mutex_;
    ModelFactory model_factory_;
    AudioSourceFactory audio_factory_;
    SessionConfig session_config_;
    std::shared_ptr<HostNotifier> notifier_;

    SessionRegistry sessions_;
    MessageHandler protocol_;
};
