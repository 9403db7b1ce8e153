#include "message_codec.hpp"

#include "errors.hpp"

#include <cstring>
#include <limits>
#include <utility>

namespace {

constexpr std::size_t kU64 = sizeof(uint64_t);
constexpr std::size_t kFrameHeader = 1 + kU64;

const uint8_t* checked_input(const void* data, std::size_t len, const char* what) {
    if (!data) {
        throw DeserializeError(std::string(what) + ": null pointer");
    }
    if (len == 0) {
        throw DeserializeError(std::string(what) + ": zero-length buffer");
    }
    return static_cast<const uint8_t*>(data);
}

template <typename Fn>
std::vector<uint8_t> write_to_vector(std::size_t size, Fn&& fn) {
    std::vector<uint8_t> bytes(size);
    ByteWriter writer(bytes.data(), bytes.size());
    fn(writer);
    if (writer.written() != size) {
        throw MurmurError("encoder wrote " + std::to_string(writer.written()) + " of " + std::to_string(size) +
                          " bytes");
    }
    return bytes;
}

std::size_t optional_size(const std::optional<uint64_t>& value) { return 1 + (value ? kU64 : 0); }

} // namespace

// ---------------------------------------------------------------------------
// Type ids

const char* to_string(MessageType type) {
    switch (type) {
    case MessageType::LoadModel: return "LoadModel";
    case MessageType::UpdateAudioData: return "UpdateAudioData";
    case MessageType::DetectWakeWords: return "DetectWakeWords";
    case MessageType::Transcribe: return "Transcribe";
    case MessageType::Debug: return "Debug";
    }
    return "Unknown";
}

const char* to_string(ResponseType type) {
    switch (type) {
    case ResponseType::Text: return "Text";
    case ResponseType::WakeWordDetection: return "WakeWordDetection";
    case ResponseType::Error: return "Error";
    }
    return "Unknown";
}

MessageType message_type_from_u8(uint8_t value) {
    if (value > static_cast<uint8_t>(MessageType::Debug)) {
        throw DeserializeError("Unknown message type " + std::to_string(value));
    }
    return static_cast<MessageType>(value);
}

ResponseType response_type_from_u8(uint8_t value) {
    if (value > static_cast<uint8_t>(ResponseType::Error)) {
        throw DeserializeError("Unknown response type " + std::to_string(value));
    }
    return static_cast<ResponseType>(value);
}

// ---------------------------------------------------------------------------
// Value types

Message Message::load_model(std::string path) {
    Message msg;
    msg.type = MessageType::LoadModel;
    msg.text = std::move(path);
    return msg;
}

Message Message::update_audio_data(std::vector<float> samples) {
    Message msg;
    msg.type = MessageType::UpdateAudioData;
    msg.samples = std::move(samples);
    return msg;
}

Message Message::detect_wake_words(std::vector<std::string> wake_words) {
    Message msg;
    msg.type = MessageType::DetectWakeWords;
    msg.wake_words = std::move(wake_words);
    return msg;
}

Message Message::transcribe() {
    Message msg;
    msg.type = MessageType::Transcribe;
    return msg;
}

Message Message::debug(std::string text) {
    Message msg;
    msg.type = MessageType::Debug;
    msg.text = std::move(text);
    return msg;
}

bool Message::operator==(const Message& other) const {
    return type == other.type && text == other.text && samples == other.samples && wake_words == other.wake_words;
}

Response Response::make_text(std::string text) {
    Response resp;
    resp.type = ResponseType::Text;
    resp.text = std::move(text);
    return resp;
}

Response Response::wake_word(const WakeWordDetection& detection) {
    Response resp;
    resp.type = ResponseType::WakeWordDetection;
    resp.detection = detection;
    return resp;
}

Response Response::error(std::string text) {
    Response resp;
    resp.type = ResponseType::Error;
    resp.text = std::move(text);
    return resp;
}

bool Response::operator==(const Response& other) const {
    return type == other.type && text == other.text && detection == other.detection;
}

bool Context::operator==(const Context& other) const {
    return model_path == other.model_path && wake_words == other.wake_words && transcript == other.transcript &&
           session == other.session;
}

// ---------------------------------------------------------------------------
// ByteWriter

uint8_t* ByteWriter::reserve(std::size_t len) {
    if (len > size_ - pos_) {
        throw MurmurError("encode overflow: " + std::to_string(len) + " bytes requested, " +
                          std::to_string(size_ - pos_) + " left");
    }
    uint8_t* at = data_ + pos_;
    pos_ += len;
    return at;
}

void ByteWriter::write_u8(uint8_t value) { *reserve(1) = value; }

void ByteWriter::write_bool(bool value) { write_u8(value ? 1 : 0); }

void ByteWriter::write_u64(uint64_t value) {
    uint8_t* at = reserve(kU64);
    for (std::size_t i = 0; i < kU64; ++i) {
        at[i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

void ByteWriter::write_f32(float value) {
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    uint8_t* at = reserve(sizeof(bits));
    for (std::size_t i = 0; i < sizeof(bits); ++i) {
        at[i] = static_cast<uint8_t>(bits >> (8 * i));
    }
}

void ByteWriter::write_bytes(const void* bytes, std::size_t len) {
    if (len == 0) return;
    std::memcpy(reserve(len), bytes, len);
}

void ByteWriter::write_string(const std::string& value) {
    write_u64(value.size());
    write_bytes(value.data(), value.size());
}

void ByteWriter::write_strings(const std::vector<std::string>& values) {
    write_u64(values.size());
    for (const auto& value : values) {
        write_string(value);
    }
}

void ByteWriter::write_floats(const std::vector<float>& values) {
    write_u64(values.size());
    for (float value : values) {
        write_f32(value);
    }
}

void ByteWriter::write_optional_u64(const std::optional<uint64_t>& value) {
    write_u8(value ? 1 : 0);
    if (value) write_u64(*value);
}

// ---------------------------------------------------------------------------
// ByteReader

const uint8_t* ByteReader::take(std::size_t len, const char* what) {
    if (len > size_ - pos_) {
        throw DeserializeError(std::string("truncated input reading ") + what + ": need " + std::to_string(len) +
                               " bytes at offset " + std::to_string(pos_) + ", have " +
                               std::to_string(size_ - pos_));
    }
    const uint8_t* at = data_ + pos_;
    pos_ += len;
    return at;
}

uint8_t ByteReader::read_u8() { return *take(1, "u8"); }

bool ByteReader::read_bool() {
    const uint8_t value = *take(1, "bool");
    if (value > 1) {
        throw DeserializeError("invalid bool byte " + std::to_string(value) + " at offset " +
                               std::to_string(pos_ - 1));
    }
    return value == 1;
}

uint64_t ByteReader::read_u64() {
    const uint8_t* at = take(kU64, "u64");
    uint64_t value = 0;
    for (std::size_t i = 0; i < kU64; ++i) {
        value |= static_cast<uint64_t>(at[i]) << (8 * i);
    }
    return value;
}

float ByteReader::read_f32() {
    const uint8_t* at = take(sizeof(uint32_t), "f32");
    uint32_t bits = 0;
    for (std::size_t i = 0; i < sizeof(bits); ++i) {
        bits |= static_cast<uint32_t>(at[i]) << (8 * i);
    }
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

// Rejects lengths that cannot fit in what is left before anything is allocated.
std::size_t ByteReader::read_length(std::size_t min_item_size, const char* what) {
    const uint64_t count = read_u64();
    if (count > std::numeric_limits<std::size_t>::max() || (min_item_size > 0 && count > remaining() / min_item_size)) {
        throw DeserializeError(std::string(what) + " length " + std::to_string(count) + " exceeds the " +
                               std::to_string(remaining()) + " bytes left");
    }
    return static_cast<std::size_t>(count);
}

std::string ByteReader::read_string() {
    const std::size_t len = read_length(1, "string");
    const uint8_t* at = take(len, "string");
    const char* chars = reinterpret_cast<const char*>(at);
    if (!valid_utf8(chars, len)) {
        throw DeserializeError("string at offset " + std::to_string(pos_ - len) + " is not valid UTF-8");
    }
    return std::string(chars, len);
}

std::vector<std::string> ByteReader::read_strings() {
    const std::size_t count = read_length(kU64, "string list");
    std::vector<std::string> values;
    values.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        values.push_back(read_string());
    }
    return values;
}

std::vector<float> ByteReader::read_floats() {
    const std::size_t count = read_length(sizeof(float), "sample list");
    std::vector<float> values(count);
    for (std::size_t i = 0; i < count; ++i) {
        values[i] = read_f32();
    }
    return values;
}

std::optional<uint64_t> ByteReader::read_optional_u64() {
    const uint8_t tag = *take(1, "option tag");
    if (tag == 0) return std::nullopt;
    if (tag != 1) {
        throw DeserializeError("invalid option tag " + std::to_string(tag) + " at offset " + std::to_string(pos_ - 1));
    }
    return read_u64();
}

void ByteReader::expect_end(const char* what) const {
    if (pos_ != size_) {
        throw DeserializeError(std::string(what) + ": " + std::to_string(size_ - pos_) + " trailing bytes");
    }
}

bool valid_utf8(const char* data, std::size_t len) {
    const auto* s = reinterpret_cast<const unsigned char*>(data);
    std::size_t i = 0;
    while (i < len) {
        const unsigned char c = s[i];
        std::size_t extra = 0;
        uint32_t cp = 0;
        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return false;
        }
        if (extra > len - i - 1) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            const unsigned char cc = s[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Sizes

std::size_t encoded_size(const std::string& value) { return kU64 + value.size(); }

std::size_t encoded_size(const std::vector<std::string>& values) {
    std::size_t size = kU64;
    for (const auto& value : values) {
        size += encoded_size(value);
    }
    return size;
}

std::size_t encoded_size(const Context& ctx) {
    return encoded_size(ctx.model_path) + encoded_size(ctx.wake_words) + encoded_size(ctx.transcript) + kU64;
}

std::size_t payload_size(const Message& msg) {
    switch (msg.type) {
    case MessageType::LoadModel:
    case MessageType::Debug: return encoded_size(msg.text);
    case MessageType::UpdateAudioData: return kU64 + msg.samples.size() * sizeof(float);
    case MessageType::DetectWakeWords: return encoded_size(msg.wake_words);
    case MessageType::Transcribe: return 0;
    }
    throw MurmurError("payload_size: unknown message type");
}

std::size_t payload_size(const Response& resp) {
    switch (resp.type) {
    case ResponseType::Text:
    case ResponseType::Error: return encoded_size(resp.text);
    case ResponseType::WakeWordDetection:
        return 1 + optional_size(resp.detection.start_idx) + optional_size(resp.detection.end_idx);
    }
    throw MurmurError("payload_size: unknown response type");
}

std::size_t frame_size(const Message& msg) { return kFrameHeader + payload_size(msg); }

std::size_t frame_size(const Response& resp) { return kFrameHeader + payload_size(resp); }

// ---------------------------------------------------------------------------
// Encoders

void encode(const Context& ctx, ByteWriter& out) {
    out.write_string(ctx.model_path);
    out.write_strings(ctx.wake_words);
    out.write_string(ctx.transcript);
    out.write_u64(ctx.session);
}

void encode_payload(const Message& msg, ByteWriter& out) {
    switch (msg.type) {
    case MessageType::LoadModel:
    case MessageType::Debug: out.write_string(msg.text); break;
    case MessageType::UpdateAudioData: out.write_floats(msg.samples); break;
    case MessageType::DetectWakeWords: out.write_strings(msg.wake_words); break;
    case MessageType::Transcribe: break;
    }
}

void encode_payload(const Response& resp, ByteWriter& out) {
    switch (resp.type) {
    case ResponseType::Text:
    case ResponseType::Error: out.write_string(resp.text); break;
    case ResponseType::WakeWordDetection:
        out.write_bool(resp.detection.detected);
        out.write_optional_u64(resp.detection.start_idx);
        out.write_optional_u64(resp.detection.end_idx);
        break;
    }
}

void encode_frame(const Message& msg, ByteWriter& out) {
    out.write_u8(static_cast<uint8_t>(msg.type));
    out.write_u64(payload_size(msg));
    encode_payload(msg, out);
}

void encode_frame(const Response& resp, ByteWriter& out) {
    out.write_u8(static_cast<uint8_t>(resp.type));
    out.write_u64(payload_size(resp));
    encode_payload(resp, out);
}

// ---------------------------------------------------------------------------
// Decoders

std::string decode_string(const void* data, std::size_t len) {
    ByteReader reader(checked_input(data, len, "string"), len);
    std::string value = reader.read_string();
    reader.expect_end("string");
    return value;
}

std::vector<std::string> decode_strings(const void* data, std::size_t len) {
    ByteReader reader(checked_input(data, len, "string list"), len);
    std::vector<std::string> values = reader.read_strings();
    reader.expect_end("string list");
    return values;
}

Context decode_context(const void* data, std::size_t len) {
    ByteReader reader(checked_input(data, len, "context"), len);
    Context ctx;
    ctx.model_path = reader.read_string();
    ctx.wake_words = reader.read_strings();
    ctx.transcript = reader.read_string();
    ctx.session = reader.read_u64();
    reader.expect_end("context");
    return ctx;
}

Message decode_message_payload(MessageType type, const void* data, std::size_t len) {
    if (type == MessageType::Transcribe) {
        if (len != 0) {
            throw DeserializeError("Transcribe carries no payload, got " + std::to_string(len) + " bytes");
        }
        return Message::transcribe();
    }

    ByteReader reader(checked_input(data, len, to_string(type)), len);
    Message msg;
    msg.type = type;
    switch (type) {
    case MessageType::LoadModel:
    case MessageType::Debug: msg.text = reader.read_string(); break;
    case MessageType::UpdateAudioData: msg.samples = reader.read_floats(); break;
    case MessageType::DetectWakeWords: msg.wake_words = reader.read_strings(); break;
    case MessageType::Transcribe: break;
    }
    reader.expect_end(to_string(type));
    return msg;
}

Response decode_response_payload(ResponseType type, const void* data, std::size_t len) {
    ByteReader reader(checked_input(data, len, to_string(type)), len);
    Response resp;
    resp.type = type;
    switch (type) {
    case ResponseType::Text:
    case ResponseType::Error: resp.text = reader.read_string(); break;
    case ResponseType::WakeWordDetection:
        resp.detection.detected = reader.read_bool();
        resp.detection.start_idx = reader.read_optional_u64();
        resp.detection.end_idx = reader.read_optional_u64();
        break;
    }
    reader.expect_end(to_string(type));
    return resp;
}

namespace {

// Returns the payload span of a frame after checking its declared length.
std::pair<const uint8_t*, std::size_t> split_frame(const void* data, std::size_t len, uint8_t& type) {
    ByteReader reader(checked_input(data, len, "frame"), len);
    type = reader.read_u8();
    const uint64_t payload_len = reader.read_u64();
    if (payload_len != reader.remaining()) {
        throw DeserializeError("frame declares " + std::to_string(payload_len) + " payload bytes, carries " +
                               std::to_string(reader.remaining()));
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    return {bytes + kFrameHeader, static_cast<std::size_t>(payload_len)};
}

} // namespace

Message decode_message_frame(const void* data, std::size_t len) {
    uint8_t type = 0;
    auto payload = split_frame(data, len, type);
    return decode_message_payload(message_type_from_u8(type), payload.first, payload.second);
}

Response decode_response_frame(const void* data, std::size_t len) {
    uint8_t type = 0;
    auto payload = split_frame(data, len, type);
    return decode_response_payload(response_type_from_u8(type), payload.first, payload.second);
}

// ---------------------------------------------------------------------------
// Heap copies

std::vector<uint8_t> to_bytes(const std::string& value) {
    return write_to_vector(encoded_size(value), [&](ByteWriter& w) { w.write_string(value); });
}

std::vector<uint8_t> to_bytes(const std::vector<std::string>& values) {
    return write_to_vector(encoded_size(values), [&](ByteWriter& w) { w.write_strings(values); });
}

std::vector<uint8_t> to_bytes(const Context& ctx) {
    return write_to_vector(encoded_size(ctx), [&](ByteWriter& w) { encode(ctx, w); });
}

std::vector<uint8_t> payload_bytes(const Message& msg) {
    return write_to_vector(payload_size(msg), [&](ByteWriter& w) { encode_payload(msg, w); });
}

std::vector<uint8_t> frame_bytes(const Message& msg) {
    return write_to_vector(frame_size(msg), [&](ByteWriter& w) { encode_frame(msg, w); });
}

std::vector<uint8_t> frame_bytes(const Response& resp) {
    return write_to_vector(frame_size(resp), [&](ByteWriter& w) { encode_frame(resp, w); });
}
