#pragma once

/// @file memory_session_store.h
/// @brief In-process session store, LRU bounded with an idle TTL

#include <functional>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>

#include <absl/time/time.h>

#include "session/session_store.h"

namespace insightx::session {

struct MemorySessionStoreConfig {
    /// Least recently used sessions are dropped beyond this count
    size_t max_sessions = 1000;

    /// Sessions untouched for this long are treated as absent
    absl::Duration idle_ttl = absl::Hours(24);
};

class MemorySessionStore : public SessionStore {
public:
    using Clock = std::function<absl::Time()>;

    explicit MemorySessionStore(MemorySessionStoreConfig config = {},
                                Clock clock = [] { return absl::Now(); });

    absl::StatusOr<std::optional<SessionState>> Get(const std::string& session_id) override;
    absl::Status Put(const SessionState& state) override;
    absl::Status Evict(const std::string& session_id) override;
    std::string Name() const override { return "memory"; }

    size_t Size() const;

private:
    struct Entry {
        SessionState state;
        absl::Time touched;
        std::list<std::string>::iterator position;
    };

    void Touch(Entry& entry, absl::Time now);

    MemorySessionStoreConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::list<std::string> lru_;  ///< most recent first
};

}  // namespace insightx::session
