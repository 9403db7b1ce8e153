#include "message_handler.hpp"

#include "errors.hpp"
#include "utils.hpp"
#include "wake_word.hpp"

#include <utility>

MessageHandler::MessageHandler(ModelFactory factory) : factory_(std::move(factory)) {}

void MessageHandler::set_model_factory(ModelFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    factory_ = std::move(factory);
}

bool MessageHandler::model_loaded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}

Response MessageHandler::handle_payload(uint8_t msg_type, const void* data, std::size_t len) {
    try {
        const MessageType type = message_type_from_u8(msg_type);
        return handle(decode_message_payload(type, data, len));
    } catch (const DeserializeError& e) {
        log_error("Protocol", std::string("rejected message: ") + e.what());
        return Response::error(std::string("DeserializeError: ") + e.what());
    }
}

Response MessageHandler::handle_frame(const void* data, std::size_t len) {
    try {
        return handle(decode_message_frame(data, len));
    } catch (const DeserializeError& e) {
        log_error("Protocol", std::string("rejected frame: ") + e.what());
        return Response::error(std::string("DeserializeError: ") + e.what());
    }
}

Response MessageHandler::handle(const Message& msg) {
    log_debug("Protocol", std::string("handling ") + to_string(msg.type));
    try {
        switch (msg.type) {
        case MessageType::LoadModel: return load_model(msg.text);
        case MessageType::UpdateAudioData: return update_audio_data(msg.samples);
        case MessageType::DetectWakeWords: return detect_wake_words(msg.wake_words);
        case MessageType::Transcribe: return transcribe();
        case MessageType::Debug:
            log_info("Host", msg.text);
            return Response::make_text(msg.text);
        }
        return Response::error("Unhandled message type");
    } catch (const ModelLoadError& e) {
        log_error("Protocol", e.what());
        return Response::error(std::string("ModelLoadError: ") + e.what());
    } catch (const InferenceError& e) {
        log_error("Protocol", e.what());
        return Response::error(std::string("InferenceError: ") + e.what());
    } catch (const std::exception& e) {
        log_error("Protocol", e.what());
        return Response::error(e.what());
    }
}

Response MessageHandler::load_model(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!factory_) {
        throw ModelLoadError("No model factory configured");
    }
    // Keep the old model until the new one has loaded.
    std::unique_ptr<InferenceService> model = factory_(path);
    if (!model) {
        throw ModelLoadError("Model factory returned nothing for " + path);
    }
    model_ = std::move(model);
    log_info("Protocol", "Model loaded: " + path);
    return Response::make_text(path);
}

Response MessageHandler::update_audio_data(const std::vector<float>& samples) {
    if (samples.empty()) {
        return Response::error("UpdateAudioData carried no samples");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    audio_ = samples;
    log_debug("Protocol", "audio buffer holds " + std::to_string(audio_.size()) + " samples");
    return Response::make_text(std::to_string(audio_.size()));
}

Response MessageHandler::detect_wake_words(const std::vector<std::string>& wake_words) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!wake_words.empty()) {
        wake_words_ = wake_words;
    }
    if (!model_) {
        return Response::error("No model loaded");
    }
    if (audio_.empty()) {
        return Response::wake_word(WakeWordDetection{});
    }

    try {
        const std::string text = join_segments(model_->infer(audio_, DecodeStrategy::Greedy));
        return Response::wake_word(detect_wake_word(text, wake_words_));
    } catch (const InferenceError& e) {
        if (e.fatal()) model_.reset();
        throw;
    }
}

Response MessageHandler::transcribe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!model_) {
        return Response::error("No model loaded");
    }
    if (audio_.empty()) {
        return Response::make_text("");
    }

    try {
        return Response::make_text(join_segments(model_->infer(audio_, DecodeStrategy::Detailed)));
    } catch (const InferenceError& e) {
        if (e.fatal()) model_.reset();
        throw;
    }
}
