#include "errors.hpp"
#include "message_codec.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <vector>

namespace {

void put_u64(std::vector<uint8_t>& out, uint64_t v) {
    for (int i = 0; i < 8; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

Message through_frame(const Message& msg) {
    auto bytes = frame_bytes(msg);
    return decode_message_frame(bytes.data(), bytes.size());
}

} // namespace

TEST(MessageCodec, StringLayoutIsLengthPrefixedLittleEndian) {
    auto bytes = to_bytes(std::string("hi"));
    std::vector<uint8_t> expected{2, 0, 0, 0, 0, 0, 0, 0, 'h', 'i'};
    EXPECT_EQ(bytes, expected);
    EXPECT_EQ(decode_string(bytes.data(), bytes.size()), "hi");
}

TEST(MessageCodec, EveryMessageSurvivesAFrame) {
    const std::vector<Message> messages{
        Message::load_model("models/vosk-small"),
        Message::update_audio_data({0.0f, 0.5f, -1.0f, 1e-7f}),
        Message::detect_wake_words({"hey", "computer"}),
        Message::detect_wake_words(),
        Message::transcribe(),
        Message::debug("ping \xC3\xA9"),
    };
    for (const auto& msg : messages) {
        EXPECT_EQ(through_frame(msg), msg) << to_string(msg.type);
    }
}

TEST(MessageCodec, ResponsesSurviveAFrame) {
    WakeWordDetection hit;
    hit.detected = true;
    hit.start_idx = 6;
    hit.end_idx = 10;

    const std::vector<Response> responses{
        Response::make_text("hello"),
        Response::make_text(""),
        Response::wake_word(hit),
        Response::wake_word(WakeWordDetection{}),
        Response::error("No model loaded"),
    };
    for (const auto& resp : responses) {
        auto bytes = frame_bytes(resp);
        EXPECT_EQ(decode_response_frame(bytes.data(), bytes.size()), resp) << to_string(resp.type);
    }
}

TEST(MessageCodec, WakeWordDetectionLayout) {
    WakeWordDetection hit;
    hit.detected = true;
    hit.start_idx = 6;
    hit.end_idx = 10;
    auto bytes = frame_bytes(Response::wake_word(hit));

    std::vector<uint8_t> expected{1};
    put_u64(expected, 19);
    expected.push_back(1);
    expected.push_back(1);
    put_u64(expected, 6);
    expected.push_back(1);
    put_u64(expected, 10);
    EXPECT_EQ(bytes, expected);
}

TEST(MessageCodec, ContextRoundTrip) {
    Context ctx;
    ctx.model_path = "/models/en";
    ctx.wake_words = {"hey", "computer"};
    ctx.transcript = "turn on the lights";
    ctx.session = (uint64_t{3} << 32) | 1;

    auto bytes = to_bytes(ctx);
    EXPECT_EQ(bytes.size(), encoded_size(ctx));
    EXPECT_EQ(decode_context(bytes.data(), bytes.size()), ctx);
}

TEST(MessageCodec, TranscribePayloadIsEmpty) {
    EXPECT_TRUE(payload_bytes(Message::transcribe()).empty());
    EXPECT_EQ(decode_message_payload(MessageType::Transcribe, nullptr, 0), Message::transcribe());

    const uint8_t extra = 0;
    EXPECT_THROW(decode_message_payload(MessageType::Transcribe, &extra, 1), DeserializeError);
}

TEST(MessageCodec, RejectsNullAndEmptyInput) {
    EXPECT_THROW(decode_string(nullptr, 8), DeserializeError);
    const uint8_t byte = 0;
    EXPECT_THROW(decode_string(&byte, 0), DeserializeError);
    EXPECT_THROW(decode_context(nullptr, 0), DeserializeError);
    EXPECT_THROW(decode_message_frame(nullptr, 0), DeserializeError);
    EXPECT_THROW(decode_message_payload(MessageType::LoadModel, &byte, 0), DeserializeError);
}

TEST(MessageCodec, RejectsTruncation) {
    auto bytes = to_bytes(std::vector<std::string>{"hey", "computer"});
    for (std::size_t len = 1; len < bytes.size(); ++len) {
        EXPECT_THROW(decode_strings(bytes.data(), len), DeserializeError) << "length " << len;
    }
}

TEST(MessageCodec, RejectsTrailingBytes) {
    auto bytes = to_bytes(std::string("abc"));
    bytes.push_back(0);
    EXPECT_THROW(decode_string(bytes.data(), bytes.size()), DeserializeError);

    auto frame = frame_bytes(Message::debug("x"));
    frame.push_back(0);
    EXPECT_THROW(decode_message_frame(frame.data(), frame.size()), DeserializeError);
}

TEST(MessageCodec, RejectsOversizedLength) {
    std::vector<uint8_t> bytes;
    put_u64(bytes, uint64_t{1} << 62);
    bytes.push_back('a');
    EXPECT_THROW(decode_string(bytes.data(), bytes.size()), DeserializeError);

    std::vector<uint8_t> list;
    put_u64(list, 1000000);
    put_u64(list, 0);
    EXPECT_THROW(decode_strings(list.data(), list.size()), DeserializeError);
}

TEST(MessageCodec, RejectsInvalidUtf8) {
    std::vector<uint8_t> bytes;
    put_u64(bytes, 2);
    bytes.push_back(0xC3);
    bytes.push_back(0x28);
    EXPECT_THROW(decode_string(bytes.data(), bytes.size()), DeserializeError);

    EXPECT_TRUE(valid_utf8("caf\xC3\xA9", 5));
    EXPECT_FALSE(valid_utf8("\xED\xA0\x80", 3)); // surrogate
    EXPECT_FALSE(valid_utf8("\xC0\xAF", 2));     // overlong
    EXPECT_FALSE(valid_utf8("\xE2\x82", 2));     // cut short
}

TEST(MessageCodec, RejectsBadBoolAndOptionTags) {
    std::vector<uint8_t> bad_bool{2, 0, 0};
    EXPECT_THROW(decode_response_payload(ResponseType::WakeWordDetection, bad_bool.data(), bad_bool.size()),
                 DeserializeError);

    std::vector<uint8_t> bad_tag{1, 7, 0};
    EXPECT_THROW(decode_response_payload(ResponseType::WakeWordDetection, bad_tag.data(), bad_tag.size()),
                 DeserializeError);
}

TEST(MessageCodec, RejectsUnknownTypeIds) {
    EXPECT_THROW(message_type_from_u8(5), DeserializeError);
    EXPECT_THROW(response_type_from_u8(3), DeserializeError);

    std::vector<uint8_t> frame{9};
    put_u64(frame, 0);
    EXPECT_THROW(decode_message_frame(frame.data(), frame.size()), DeserializeError);
}

TEST(MessageCodec, RejectsFrameLengthMismatch) {
    auto frame = frame_bytes(Message::load_model("abc"));
    frame[1] = static_cast<uint8_t>(frame[1] + 1);
    EXPECT_THROW(decode_message_frame(frame.data(), frame.size()), DeserializeError);
}

TEST(MessageCodec, SampleListCarriesRawFloatBits) {
    auto bytes = payload_bytes(Message::update_audio_data({1.0f}));
    ASSERT_EQ(bytes.size(), 12u);
    float value = 0.0f;
    std::memcpy(&value, bytes.data() + 8, sizeof(value));
    EXPECT_EQ(value, 1.0f);
    EXPECT_EQ(bytes[0], 1u);
}

TEST(ByteWriter, OverflowThrows) {
    uint8_t buffer[4];
    ByteWriter writer(buffer, sizeof(buffer));
    EXPECT_THROW(writer.write_u64(1), MurmurError);
}
