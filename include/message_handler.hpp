#pragma once

#include "inference.hpp"
#include "message_codec.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Serves the discriminated Message/Response protocol. Every failure comes
// back as an Error response; handle() does not throw.
class MessageHandler {
public:
    explicit MessageHandler(ModelFactory factory);

    Response handle(const Message& msg);

    // Decodes, dispatches, and turns decode failures into Error responses.
    Response handle_payload(uint8_t msg_type, const void* data, std::size_t len);
    Response handle_frame(const void* data, std::size_t len);

    void set_model_factory(ModelFactory factory);
    bool model_loaded() const;

private:
    Response load_model(const std::string& path);
    Response update_audio_data(const std::vector<float>& samples);
    Response detect_wake_words(const std::vector<std::string>& wake_words);
    Response transcribe();

    mutable std::mutex mutex_;
    ModelFactory factory_;
    std::unique_ptr<InferenceService> model_;
    std::vector<float> audio_;
    std::vector<std::string> wake_words_;
};
