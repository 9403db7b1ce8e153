#include "boundary.hpp"

#include "config.hpp"
#include "errors.hpp"
#include "transcriber.hpp"
#include "utils.hpp"

#include <utility>

Boundary& Boundary::instance() {
    static Boundary boundary;
    return boundary;
}

Boundary::Boundary()
    : model_factory_(make_transcriber),
      audio_factory_([] { return std::unique_ptr<AudioSource>(new AudioCapture(load_audio_config())); }),
      session_config_(load_session_config()),
      protocol_(make_transcriber) {
    apply_log_level_from_env();
}

void Boundary::set_model_factory(ModelFactory factory) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        model_factory_ = factory;
    }
    protocol_.set_model_factory(std::move(factory));
}

void Boundary::set_audio_source_factory(AudioSourceFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    audio_factory_ = std::move(factory);
}

void Boundary::set_session_config(const SessionConfig& cfg) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_config_ = cfg;
}

void Boundary::set_notifier(std::shared_ptr<HostNotifier> notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

std::shared_ptr<HostNotifier> Boundary::notifier() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return notifier_;
}

std::unique_ptr<InferenceService> Boundary::load_model(const std::string& model_path) const {
    ModelFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        factory = model_factory_;
    }
    if (!factory) {
        throw ModelLoadError("No model factory configured");
    }
    std::unique_ptr<InferenceService> model = factory(model_path);
    if (!model) {
        throw ModelLoadError("Model factory returned nothing for " + model_path);
    }
    return model;
}

Context Boundary::init_context(const std::string& model_path, std::vector<std::string> wake_words) {
    Context ctx;
    ctx.model_path = model_path;
    ctx.wake_words = wake_words;
    ctx.session = sessions_.create(model_path, std::move(wake_words), load_model(model_path));
    log_info("Boundary", "Context ready for " + model_path + " with " + std::to_string(ctx.wake_words.size()) +
                             " wake words");
    return ctx;
}

Context Boundary::transcribe_speech(const Context& ctx, unsigned listen_duration_ms) {
    SessionConfig cfg;
    AudioSourceFactory audio_factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg = session_config_;
        audio_factory = audio_factory_;
    }
    cfg.listen_duration_ms = listen_duration_ms;
    std::shared_ptr<HostNotifier> host = notifier();

    if (!audio_factory) {
        throw DeviceError(DeviceErrorKind::Unavailable, "No audio source configured");
    }

    Context updated = ctx;
    if (ctx.session != 0 && sessions_.contains(ctx.session)) {
        SessionLease lease = sessions_.lease(ctx.session);
        std::unique_ptr<InferenceService> model = lease.take_model();
        if (!model) {
            model = load_model(ctx.model_path);
        }

        ListenSession session(audio_factory(), std::move(model), ctx.wake_words, cfg, host.get());
        lease.attach(&session);
        try {
            updated.transcript = session.run();
        } catch (...) {
            lease.give_back(session.release_model());
            throw;
        }
        lease.give_back(session.release_model());
        return updated;
    }

    log_info("Boundary", "session " + std::to_string(ctx.session) + " is not registered, loading " + ctx.model_path);
    ListenSession session(audio_factory(), load_model(ctx.model_path), ctx.wake_words, cfg, host.get());
    updated.transcript = session.run();
    return updated;
}

bool Boundary::stop_listening(const Context& ctx) { return sessions_.stop(ctx.session); }

bool Boundary::release_context(const Context& ctx) { return sessions_.release(ctx.session); }
