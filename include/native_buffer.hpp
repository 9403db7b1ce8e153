#pragma once

#include "errors.hpp"
#include "message_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Host-owned buffers. Each one is allocated at exactly its encoded size and
// stays alive until free_host_buffer() is called with the same pointer and
// length. The ledger only counts; it does not detect misuse.

namespace native_buffer_detail {
void note_allocated(std::size_t len);
void note_freed(std::size_t len);
} // namespace native_buffer_detail

std::size_t outstanding_buffers();
std::size_t outstanding_bytes();

// Allocates `size` bytes, lets `write` fill them through a ByteWriter and
// hands the buffer over. `write` must fill the buffer exactly.
template <typename Fn>
void* release_to_host(std::size_t size, Fn&& write, std::size_t* len_out) {
    if (!len_out) {
        throw MurmurError("length out-parameter is null");
    }
    *len_out = 0;
    if (size == 0) return nullptr;

    std::unique_ptr<uint8_t[]> bytes(new uint8_t[size]);
    ByteWriter writer(bytes.get(), size);
    write(writer);
    if (writer.written() != size) {
        throw MurmurError("encoder wrote " + std::to_string(writer.written()) + " of " + std::to_string(size) +
                          " bytes");
    }

    native_buffer_detail::note_allocated(size);
    *len_out = size;
    return bytes.release();
}

void free_host_buffer(void* ptr, std::size_t len);
