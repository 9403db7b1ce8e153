#include "murmur.h"

#include "boundary.hpp"
#include "errors.hpp"
#include "message_codec.hpp"
#include "native_buffer.hpp"
#include "utils.hpp"

#include <memory>
#include <string>

namespace {

thread_local std::string t_last_error;

void record_error(const char* where, const std::string& what) {
    t_last_error = std::string(where) + ": " + what;
    log_error("FFI", t_last_error);
}

void* context_to_host(const Context& ctx, size_t* len_out) {
    return release_to_host(encoded_size(ctx), [&](ByteWriter& w) { encode(ctx, w); }, len_out);
}

void* response_to_host(const Response& resp, uint8_t* type_out, size_t* len_out) {
    *type_out = static_cast<uint8_t>(resp.type);
    return release_to_host(payload_size(resp), [&](ByteWriter& w) { encode_payload(resp, w); }, len_out);
}

// Runs fn, turning every exception into a recorded error and a null return.
template <typename Fn>
void* guarded(const char* where, size_t* len_out, Fn&& fn) {
    if (len_out) *len_out = 0;
    try {
        if (!len_out) {
            throw MurmurError("length out-parameter is null");
        }
        t_last_error.clear();
        return fn();
    } catch (const std::exception& e) {
        record_error(where, e.what());
    } catch (...) {
        record_error(where, "unknown exception");
    }
    if (len_out) *len_out = 0;
    return nullptr;
}

template <typename Fn>
int guarded_status(const char* where, Fn&& fn) {
    try {
        t_last_error.clear();
        return fn() ? 0 : 1;
    } catch (const std::exception& e) {
        record_error(where, e.what());
    } catch (...) {
        record_error(where, "unknown exception");
    }
    return -1;
}

} // namespace

extern "C" {

void murmur_set_log_level(int level) {
    if (level < 0) level = 0;
    if (level > static_cast<int>(LogLevel::Off)) level = static_cast<int>(LogLevel::Off);
    set_log_level(static_cast<LogLevel>(level));
}

void murmur_register_host(int64_t port, murmur_post_fn post) {
    if (!post) {
        Boundary::instance().set_notifier(nullptr);
        log_debug("FFI", "host notification channel cleared");
        return;
    }
    Boundary::instance().set_notifier(std::make_shared<PortNotifier>(port, post));
    log_debug("FFI", "host notification channel registered on port " + std::to_string(port));
}

void* murmur_init_context(const void* model_path, size_t model_path_len, const void* wake_words,
                          size_t wake_words_len, size_t* ctx_len_out) {
    return guarded("init_context", ctx_len_out, [&]() -> void* {
        std::string path = decode_string(model_path, model_path_len);
        std::vector<std::string> words = decode_strings(wake_words, wake_words_len);
        Context ctx = Boundary::instance().init_context(path, std::move(words));
        return context_to_host(ctx, ctx_len_out);
    });
}

void* murmur_transcribe_speech(const void* ctx, size_t ctx_len, size_t listen_duration_ms, size_t* ctx_len_out) {
    return guarded("transcribe_speech", ctx_len_out, [&]() -> void* {
        Context decoded = decode_context(ctx, ctx_len);
        const unsigned duration =
            listen_duration_ms > 0xFFFFFFFFu ? 0xFFFFFFFFu : static_cast<unsigned>(listen_duration_ms);
        Context updated = Boundary::instance().transcribe_speech(decoded, duration);
        return context_to_host(updated, ctx_len_out);
    });
}

int murmur_stop_listening(const void* ctx, size_t ctx_len) {
    return guarded_status("stop_listening",
                          [&] { return Boundary::instance().stop_listening(decode_context(ctx, ctx_len)); });
}

int murmur_release_context(const void* ctx, size_t ctx_len) {
    return guarded_status("release_context",
                          [&] { return Boundary::instance().release_context(decode_context(ctx, ctx_len)); });
}

void* murmur_send_message(uint8_t msg_type, const void* msg, size_t msg_len, uint8_t* resp_type_out,
                          size_t* resp_len_out) {
    return guarded("send_message", resp_len_out, [&]() -> void* {
        if (!resp_type_out) {
            throw MurmurError("response type out-parameter is null");
        }
        Response resp = Boundary::instance().protocol().handle_payload(msg_type, msg, msg_len);
        return response_to_host(resp, resp_type_out, resp_len_out);
    });
}

void* murmur_send_frame(const void* frame, size_t frame_len, size_t* resp_len_out) {
    return guarded("send_frame", resp_len_out, [&]() -> void* {
        Response resp = Boundary::instance().protocol().handle_frame(frame, frame_len);
        return release_to_host(frame_size(resp), [&](ByteWriter& w) { encode_frame(resp, w); }, resp_len_out);
    });
}

void* murmur_last_error(size_t* len_out) {
    if (!len_out) return nullptr;
    *len_out = 0;
    if (t_last_error.empty()) return nullptr;
    try {
        const std::string text = t_last_error;
        return release_to_host(encoded_size(text), [&](ByteWriter& w) { w.write_string(text); }, len_out);
    } catch (const std::exception& e) {
        log_error("FFI", std::string("last_error: ") + e.what());
    }
    *len_out = 0;
    return nullptr;
}

void murmur_free_buffer(void* ptr, size_t len) { free_host_buffer(ptr, len); }

size_t murmur_outstanding_buffers(void) { return outstanding_buffers(); }

} // extern "C"
