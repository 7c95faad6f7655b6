/// @file memory_session_store.cpp
/// @brief In-process session store implementation

#include "session/memory_session_store.h"

#include "common/logging.h"

namespace insightx::session {

MemorySessionStore::MemorySessionStore(MemorySessionStoreConfig config, Clock clock)
    : config_(config), clock_(std::move(clock)) {}

void MemorySessionStore::Touch(Entry& entry, absl::Time now) {
    entry.touched = now;
    lru_.splice(lru_.begin(), lru_, entry.position);
}

absl::StatusOr<std::optional<SessionState>> MemorySessionStore::Get(
    const std::string& session_id) {
    absl::Time now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(session_id);
    if (it == entries_.end()) {
        return std::optional<SessionState>();
    }
    if (now - it->second.touched > config_.idle_ttl) {
        INSIGHTX_LOG_DEBUG("Session {} expired after idling", session_id);
        lru_.erase(it->second.position);
        entries_.erase(it);
        return std::optional<SessionState>();
    }
    Touch(it->second, now);
    return std::optional<SessionState>(it->second.state);
}

absl::Status MemorySessionStore::Put(const SessionState& state) {
    absl::Time now = clock_();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(state.session_id);
    if (it != entries_.end()) {
        it->second.state = state;
        Touch(it->second, now);
        return absl::OkStatus();
    }

    lru_.push_front(state.session_id);
    entries_.emplace(state.session_id, Entry{state, now, lru_.begin()});

    while (entries_.size() > config_.max_sessions && !lru_.empty()) {
        INSIGHTX_LOG_DEBUG("Session store full, dropping session {}", lru_.back());
        entries_.erase(lru_.back());
        lru_.pop_back();
    }
    return absl::OkStatus();
}

absl::Status MemorySessionStore::Evict(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_id);
    if (it != entries_.end()) {
        lru_.erase(it->second.position);
        entries_.erase(it);
    }
    return absl::OkStatus();
}

size_t MemorySessionStore::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}  // namespace insightx::session
