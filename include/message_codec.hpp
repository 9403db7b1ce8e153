#pragma once

#include "wake_word.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Wire format: little-endian fixed-width integers, bool as one byte (0/1),
// f32 as IEEE-754 bits, string = u64 byte length + UTF-8, list = u64 count +
// items, optional = u8 tag (0/1) + value. A frame is u8 type + u64 payload
// length + payload.

enum class MessageType : uint8_t {
    LoadModel = 0,
    UpdateAudioData = 1,
    DetectWakeWords = 2,
    Transcribe = 3,
    Debug = 4,
};

enum class ResponseType : uint8_t {
    Text = 0,
    WakeWordDetection = 1,
    Error = 2,
};

const char* to_string(MessageType type);
const char* to_string(ResponseType type);

// Throws DeserializeError for an unknown id.
MessageType message_type_from_u8(uint8_t value);
ResponseType response_type_from_u8(uint8_t value);

struct Message {
    MessageType type = MessageType::Transcribe;
    std::string text;                       // LoadModel path, Debug text
    std::vector<float> samples;             // UpdateAudioData
    std::vector<std::string> wake_words;    // DetectWakeWords, empty keeps the current list

    static Message load_model(std::string path);
    static Message update_audio_data(std::vector<float> samples);
    static Message detect_wake_words(std::vector<std::string> wake_words = {});
    static Message transcribe();
    static Message debug(std::string text);

    bool operator==(const Message& other) const;
    bool operator!=(const Message& other) const { return !(*this == other); }
};

struct Response {
    ResponseType type = ResponseType::Text;
    std::string text;                       // Text, Error
    WakeWordDetection detection;            // WakeWordDetection

    static Response make_text(std::string text);
    static Response wake_word(const WakeWordDetection& detection);
    static Response error(std::string text);

    bool operator==(const Response& other) const;
    bool operator!=(const Response& other) const { return !(*this == other); }
};

// Session state the host carries between calls.
struct Context {
    std::string model_path;
    std::vector<std::string> wake_words;
    std::string transcript;
    uint64_t session = 0;                   // registry handle, 0 when none

    bool operator==(const Context& other) const;
    bool operator!=(const Context& other) const { return !(*this == other); }
};

// Writes into a caller-provided buffer of fixed size. Running past the end
// means an encoded_size() disagreed with its encoder and throws MurmurError.
class ByteWriter {
public:
    ByteWriter(uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    void write_u8(uint8_t value);
    void write_bool(bool value);
    void write_u64(uint64_t value);
    void write_f32(float value);
    void write_bytes(const void* bytes, std::size_t len);
    void write_string(const std::string& value);
    void write_strings(const std::vector<std::string>& values);
    void write_floats(const std::vector<float>& values);
    void write_optional_u64(const std::optional<uint64_t>& value);

    std::size_t written() const { return pos_; }
    std::size_t size() const { return size_; }

private:
    uint8_t* reserve(std::size_t len);

    uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

// Bounds-checked reads; anything malformed throws DeserializeError.
class ByteReader {
public:
    ByteReader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    uint8_t read_u8();
    bool read_bool();
    uint64_t read_u64();
    float read_f32();
    std::string read_string();
    std::vector<std::string> read_strings();
    std::vector<float> read_floats();
    std::optional<uint64_t> read_optional_u64();

    // Throws unless every byte was consumed.
    void expect_end(const char* what) const;

    std::size_t remaining() const { return size_ - pos_; }

private:
    const uint8_t* take(std::size_t len, const char* what);
    std::size_t read_length(std::size_t min_item_size, const char* what);

    const uint8_t* data_;
    std::size_t size_;
    std::size_t pos_{0};
};

bool valid_utf8(const char* data, std::size_t len);

std::size_t encoded_size(const std::string& value);
std::size_t encoded_size(const std::vector<std::string>& values);
std::size_t encoded_size(const Context& ctx);
std::size_t payload_size(const Message& msg);
std::size_t payload_size(const Response& resp);
std::size_t frame_size(const Message& msg);
std::size_t frame_size(const Response& resp);

void encode(const Context& ctx, ByteWriter& out);
void encode_payload(const Message& msg, ByteWriter& out);
void encode_payload(const Response& resp, ByteWriter& out);
void encode_frame(const Message& msg, ByteWriter& out);
void encode_frame(const Response& resp, ByteWriter& out);

// All decoders reject null or empty input, truncation and trailing bytes. The
// Transcribe payload is the one legitimately empty payload.
std::string decode_string(const void* data, std::size_t len);
std::vector<std::string> decode_strings(const void* data, std::size_t len);
Context decode_context(const void* data, std::size_t len);
Message decode_message_payload(MessageType type, const void* data, std::size_t len);
Response decode_response_payload(ResponseType type, const void* data, std::size_t len);
Message decode_message_frame(const void* data, std::size_t len);
Response decode_response_frame(const void* data, std::size_t len);

// Heap copies for tests and for C++ hosts.
std::vector<uint8_t> to_bytes(const std::string& value);
std::vector<uint8_t> to_bytes(const std::vector<std::string>& values);
std::vector<uint8_t> to_bytes(const Context& ctx);
std::vector<uint8_t> payload_bytes(const Message& msg);
std::vector<uint8_t> frame_bytes(const Message& msg);
std::vector<uint8_t> frame_bytes(const Response& resp);
