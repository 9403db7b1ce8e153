#include "session_registry.hpp"

#include "errors.hpp"
#include "listen_session.hpp"
#include "utils.hpp"

#include <utility>

namespace {

SessionHandle make_handle(uint32_t index, uint32_t generation) {
    return (static_cast<uint64_t>(generation) << 32) | (static_cast<uint64_t>(index) + 1);
}

} // namespace

// ---------------------------------------------------------------------------
// SessionLease

SessionLease::SessionLease(SessionRegistry* registry, SessionHandle handle, std::unique_ptr<InferenceService> model,
                           std::string model_path)
    : registry_(registry), handle_(handle), model_(std::move(model)), model_path_(std::move(model_path)) {}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : registry_(other.registry_),
      handle_(other.handle_),
      model_(std::move(other.model_)),
      model_path_(std::move(other.model_path_)) {
    other.registry_ = nullptr;
}

SessionLease::~SessionLease() {
    if (registry_) registry_->end_lease(handle_, std::move(model_));
}

void SessionLease::attach(ListenSession* session) {
    if (registry_) registry_->attach(handle_, session);
}

void SessionLease::give_back(std::unique_ptr<InferenceService> model) {
    model_ = std::move(model);
    if (registry_) registry_->attach(handle_, nullptr);
}

// ---------------------------------------------------------------------------
// SessionRegistry

SessionHandle SessionRegistry::create(std::string model_path, std::vector<std::string> wake_words,
                                      std::unique_ptr<InferenceService> model) {
    auto entry = std::make_unique<Entry>();
    entry->model_path = std::move(model_path);
    entry->wake_words = std::move(wake_words);
    entry->model = std::move(model);

    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t index;
    if (!free_slots_.empty()) {
        index = free_slots_.back();
        free_slots_.pop_back();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.emplace_back();
    }
    slots_[index].entry = std::move(entry);
    const SessionHandle handle = make_handle(index, slots_[index].generation);
    log_debug("Registry", "created session " + std::to_string(handle));
    return handle;
}

SessionRegistry::Entry* SessionRegistry::find(SessionHandle handle) const {
    const uint64_t low = handle & 0xFFFFFFFFu;
    if (low == 0) return nullptr;
    const auto index = static_cast<std::size_t>(low - 1);
    const auto generation = static_cast<uint32_t>(handle >> 32);
    if (index >= slots_.size()) return nullptr;

    const Slot& slot = slots_[index];
    if (slot.generation != generation || !slot.entry) return nullptr;
    return slot.entry.get();
}

bool SessionRegistry::contains(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find(handle) != nullptr;
}

bool SessionRegistry::listening(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    return entry && entry->leased;
}

SessionLease SessionRegistry::lease(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    if (!entry) {
        throw MurmurError("Unknown session " + std::to_string(handle));
    }
    if (entry->leased) {
        throw MurmurError("Session " + std::to_string(handle) + " is already listening");
    }
    entry->leased = true;
    entry->stop_pending = false;
    return SessionLease(this, handle, std::move(entry->model), entry->model_path);
}

void SessionRegistry::attach(SessionHandle handle, ListenSession* session) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    if (!entry || !entry->leased) {
        // Released while the lease was open.
        if (session) session->stop();
        return;
    }
    entry->active = session;
    if (entry->stop_pending && session) {
        session->stop();
    }
}

void SessionRegistry::end_lease(SessionHandle handle, std::unique_ptr<InferenceService> model) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    if (!entry) return; // released meanwhile, the model goes with the lease
    entry->model = std::move(model);
    entry->active = nullptr;
    entry->leased = false;
    entry->stop_pending = false;
}

bool SessionRegistry::stop(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    if (!entry || !entry->leased) return false;
    if (entry->active) {
        entry->active->stop();
    } else {
        entry->stop_pending = true;
    }
    return true;
}

bool SessionRegistry::release(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry* entry = find(handle);
    if (!entry) return false;
    if (entry->active) entry->active->stop();

    const auto index = static_cast<std::size_t>((handle & 0xFFFFFFFFu) - 1);
    slots_[index].entry.reset();
    ++slots_[index].generation;
    if (slots_[index].generation == 0) slots_[index].generation = 1;
    free_slots_.push_back(static_cast<uint32_t>(index));
    log_debug("Registry", "released session " + std::to_string(handle));
    return true;
}

std::size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size() - free_slots_.size();
}
