#include "errors.hpp"
#include "message_handler.hpp"
#include "test_doubles.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace {

ModelFactory marker_factory(std::vector<std::string>* loaded = nullptr) {
    return [loaded](const std::string& path) -> std::unique_ptr<InferenceService> {
        if (path == "missing") throw ModelLoadError("no model at " + path);
        if (loaded) loaded->push_back(path);
        return marker_model();
    };
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

TEST(MessageHandler, RequiresModelBeforeInference) {
    MessageHandler handler(marker_factory());
    EXPECT_EQ(handler.handle(Message::transcribe()).type, ResponseType::Error);
    EXPECT_EQ(handler.handle(Message::detect_wake_words({"hey"})).type, ResponseType::Error);
    EXPECT_FALSE(handler.model_loaded());
}

TEST(MessageHandler, LoadModelEchoesPath) {
    std::vector<std::string> loaded;
    MessageHandler handler(marker_factory(&loaded));
    EXPECT_EQ(handler.handle(Message::load_model("models/en")), Response::make_text("models/en"));
    EXPECT_TRUE(handler.model_loaded());
    EXPECT_EQ(loaded, std::vector<std::string>{"models/en"});
}

TEST(MessageHandler, FailedLoadKeepsPreviousModel) {
    MessageHandler handler(marker_factory());
    handler.handle(Message::load_model("models/en"));

    Response resp = handler.handle(Message::load_model("missing"));
    EXPECT_EQ(resp.type, ResponseType::Error);
    EXPECT_TRUE(starts_with(resp.text, "ModelLoadError: ")) << resp.text;
    EXPECT_TRUE(handler.model_loaded());
}

TEST(MessageHandler, DetectAndTranscribeBufferedAudio) {
    MessageHandler handler(marker_factory());
    handler.handle(Message::load_model("models/en"));

    EXPECT_EQ(handler.handle(Message::update_audio_data(marked(320))), Response::make_text("320"));

    WakeWordDetection expected;
    expected.detected = true;
    expected.start_idx = 4;
    expected.end_idx = 9;
    EXPECT_EQ(handler.handle(Message::detect_wake_words({"there"})), Response::wake_word(expected));

    // An empty list keeps the previous wake words.
    EXPECT_EQ(handler.handle(Message::detect_wake_words()), Response::wake_word(expected));

    EXPECT_EQ(handler.handle(Message::transcribe()), Response::make_text("hey there"));
}

TEST(MessageHandler, EmptyAudioShortCircuits) {
    MessageHandler handler(marker_factory());
    handler.handle(Message::load_model("models/en"));

    EXPECT_EQ(handler.handle(Message::update_audio_data({})).type, ResponseType::Error);
    EXPECT_EQ(handler.handle(Message::detect_wake_words({"hey"})), Response::wake_word(WakeWordDetection{}));
    EXPECT_EQ(handler.handle(Message::transcribe()), Response::make_text(""));
}

TEST(MessageHandler, DebugEchoes) {
    MessageHandler handler(marker_factory());
    EXPECT_EQ(handler.handle(Message::debug("ping")), Response::make_text("ping"));
}

TEST(MessageHandler, FatalInferenceUnloadsModel) {
    MessageHandler handler([](const std::string&) -> std::unique_ptr<InferenceService> {
        return std::make_unique<StubModel>([](const std::vector<float>&, DecodeStrategy) -> std::vector<std::string> {
            throw InferenceError("decoder lost", true);
        });
    });
    handler.handle(Message::load_model("models/en"));
    handler.handle(Message::update_audio_data(silence(16)));

    Response resp = handler.handle(Message::transcribe());
    EXPECT_EQ(resp.type, ResponseType::Error);
    EXPECT_TRUE(starts_with(resp.text, "InferenceError: ")) << resp.text;
    EXPECT_FALSE(handler.model_loaded());
}

TEST(MessageHandler, MalformedPayloadBecomesErrorResponse) {
    MessageHandler handler(marker_factory());

    const uint8_t junk[] = {1, 2, 3};
    Response resp = handler.handle_payload(static_cast<uint8_t>(MessageType::LoadModel), junk, sizeof(junk));
    EXPECT_EQ(resp.type, ResponseType::Error);
    EXPECT_TRUE(starts_with(resp.text, "DeserializeError: ")) << resp.text;

    EXPECT_EQ(handler.handle_payload(42, junk, sizeof(junk)).type, ResponseType::Error);
    EXPECT_EQ(handler.handle_payload(static_cast<uint8_t>(MessageType::Debug), nullptr, 0).type,
              ResponseType::Error);
    EXPECT_EQ(handler.handle_frame(junk, sizeof(junk)).type, ResponseType::Error);
}

TEST(MessageHandler, FramedRequest) {
    MessageHandler handler(marker_factory());
    auto frame = frame_bytes(Message::debug("framed"));
    EXPECT_EQ(handler.handle_frame(frame.data(), frame.size()), Response::make_text("framed"));

    auto payload = payload_bytes(Message::transcribe());
    EXPECT_EQ(handler.handle_payload(static_cast<uint8_t>(MessageType::Transcribe), payload.data(), payload.size())
                  .type,
              ResponseType::Error); // no model yet
}
