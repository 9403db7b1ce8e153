#include "native_buffer.hpp"

#include <atomic>

namespace {

std::atomic<std::size_t> g_outstanding_buffers{0};
std::atomic<std::size_t> g_outstanding_bytes{0};

} // namespace

namespace native_buffer_detail {

void note_allocated(std::size_t len) {
    g_outstanding_buffers.fetch_add(1);
    g_outstanding_bytes.fetch_add(len);
}

void note_freed(std::size_t len) {
    g_outstanding_buffers.fetch_sub(1);
    g_outstanding_bytes.fetch_sub(len);
}

} // namespace native_buffer_detail

std::size_t outstanding_buffers() { return g_outstanding_buffers.load(); }

std::size_t outstanding_bytes() { return g_outstanding_bytes.load(); }

void free_host_buffer(void* ptr, std::size_t len) {
    if (!ptr) return;
    delete[] static_cast<uint8_t*>(ptr);
    native_buffer_detail::note_freed(len);
}
