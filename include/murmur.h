#pragma once
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * Every non-null pointer returned by this library is owned by the caller and
 * must be released exactly once with murmur_free_buffer(ptr, len), passing the
 * length reported alongside it. Freeing twice, freeing with another length or
 * touching the buffer after free is undefined behavior.
 *
 * Functions returning a buffer return NULL on failure; the reason can then be
 * fetched with murmur_last_error() on the same thread.
 */

/** Message ids for murmur_send_message. */
enum murmur_message_type {
  MURMUR_MSG_LOAD_MODEL = 0,
  MURMUR_MSG_UPDATE_AUDIO_DATA = 1,
  MURMUR_MSG_DETECT_WAKE_WORDS = 2,
  MURMUR_MSG_TRANSCRIBE = 3,
  MURMUR_MSG_DEBUG = 4,
};

/** Response ids written by murmur_send_message. */
enum murmur_response_type {
  MURMUR_RESP_TEXT = 0,
  MURMUR_RESP_WAKE_WORD = 1,
  MURMUR_RESP_ERROR = 2,
};

/** Host notification hook: receives each finished transcript (UTF-8, not NUL
 *  terminated beyond len). Return nonzero when the host accepted it. */
typedef int (*murmur_post_fn)(int64_t port, const char* text, size_t len);

/** 0 trace, 1 debug, 2 info, 3 warn, 4 error, 5 off */
void murmur_set_log_level(int level);

/** Registers (or with post == NULL, clears) the host notification channel. */
void murmur_register_host(int64_t port, murmur_post_fn post);

/** model_path: encoded string, wake_words: encoded list of strings.
 *  Loads the model and returns the encoded context. */
void* murmur_init_context(const void* model_path, size_t model_path_len,
                          const void* wake_words, size_t wake_words_len,
                          size_t* ctx_len_out);

/** Listens on the microphone until listen_duration_ms elapses (0 = until
 *  murmur_stop_listening) and returns the context with its transcript set. */
void* murmur_transcribe_speech(const void* ctx, size_t ctx_len,
                               size_t listen_duration_ms,
                               size_t* ctx_len_out);

/** Returns 0 when a running session was asked to stop. */
int murmur_stop_listening(const void* ctx, size_t ctx_len);

/** Drops the native session behind ctx. Returns 0 on success. */
int murmur_release_context(const void* ctx, size_t ctx_len);

/** Discriminated protocol. The payload of MURMUR_MSG_TRANSCRIBE is empty. */
void* murmur_send_message(uint8_t msg_type, const void* msg, size_t msg_len,
                          uint8_t* resp_type_out, size_t* resp_len_out);

/** Same protocol with framed (type + length + payload) messages both ways. */
void* murmur_send_frame(const void* frame, size_t frame_len, size_t* resp_len_out);

/** Last error recorded on this thread as an encoded string, or NULL. */
void* murmur_last_error(size_t* len_out);

/** NULL is a no-op. */
void murmur_free_buffer(void* ptr, size_t len);

/** Buffers handed out and not yet freed. */
size_t murmur_outstanding_buffers(void);

#ifdef __cplusplus
}
#endif
