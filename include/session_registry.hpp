#pragma once

#include "inference.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class ListenSession;
class SessionRegistry;

// Slot index in the low 32 bits (plus one, so 0 is never valid), slot
// generation in the high 32 bits.
using SessionHandle = uint64_t;

// Exclusive use of one registered session for the duration of a listen call.
// Whatever model is handed back with give_back() is parked again when the
// lease ends; without it the session reloads its model next time.
class SessionLease {
public:
    SessionLease(SessionLease&& other) noexcept;
    ~SessionLease();

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;
    SessionLease& operator=(SessionLease&&) = delete;

    // Null when the session has no parked model.
    std::unique_ptr<InferenceService> take_model() { return std::move(model_); }
    const std::string& model_path() const { return model_path_; }

    // Makes the running session reachable from SessionRegistry::stop().
    void attach(ListenSession* session);

    // Detaches the session and keeps its model for parking. Call before the
    // attached session is destroyed.
    void give_back(std::unique_ptr<InferenceService> model);

private:
    friend class SessionRegistry;
    SessionLease(SessionRegistry* registry, SessionHandle handle, std::unique_ptr<InferenceService> model,
                 std::string model_path);

    SessionRegistry* registry_;
    SessionHandle handle_;
    std::unique_ptr<InferenceService> model_;
    std::string model_path_;
};

class SessionRegistry {
public:
    SessionHandle create(std::string model_path, std::vector<std::string> wake_words,
                         std::unique_ptr<InferenceService> model);

    bool contains(SessionHandle handle) const;
    bool listening(SessionHandle handle) const;

    // Throws MurmurError for an unknown handle or a session that is already
    // listening.
    SessionLease lease(SessionHandle handle);

    // Asks a listening session to stop; a stop that arrives before the session
    // is attached is applied on attach. Returns false for unknown or idle handles.
    bool stop(SessionHandle handle);

    // Drops the entry, stopping it first if it is listening.
    bool release(SessionHandle handle);

    std::size_t size() const;

private:
    friend class SessionLease;

    struct Entry {
        std::string model_path;
        std::vector<std::string> wake_words;
        std::unique_ptr<InferenceService> model;
        bool leased = false;
        bool stop_pending = false;
        ListenSession* active = nullptr;
    };

    struct Slot {
        uint32_t generation = 1;
        std::unique_ptr<Entry> entry;
    };

    Entry* find(SessionHandle handle) const;
    void attach(SessionHandle handle, ListenSession* session);
    void end_lease(SessionHandle handle, std::unique_ptr<InferenceService> model);

    mutable std::mutex mutex_;
    std::vector<Slot> slots_;
    std::vector<uint32_t> free_slots_;
};
