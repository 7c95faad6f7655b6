#pragma once

/// @file session_manager.h
/// @brief Conversation memory and per-session rate limiting

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "session/session_state.h"
#include "session/session_store.h"

namespace insightx::session {

struct SessionManagerConfig {
    /// Turns kept per session (older turns are dropped)
    size_t context_window = 6;

    /// Admitted requests per session in any rate window
    size_t requests_per_minute = 10;

    absl::Duration rate_window = absl::Seconds(60);
};

struct SessionManagerStats {
    uint64_t sessions_created = 0;
    uint64_t requests_admitted = 0;
    uint64_t requests_rate_limited = 0;
    uint64_t resets = 0;
};

/// @brief Serialised read-modify-write access to sessions in a SessionStore
///
/// Every operation on a session runs under that session's mutex, so turns
/// and rate-limit timestamps of one session are never interleaved while
/// different sessions proceed concurrently.
///
/// Example usage:
/// @code
///   SessionManager sessions(std::make_shared<MemorySessionStore>());
///   if (auto status = sessions.CheckAndRecord(id); !status.ok()) {
///       // kRateLimited: answer without touching the session
///   }
///   auto state = sessions.Get(id);
///   sessions.Append(id, turn);
/// @endcode
class SessionManager {
public:
    using Clock = std::function<absl::Time()>;

    explicit SessionManager(std::shared_ptr<SessionStore> store,
                            SessionManagerConfig config = {},
                            Clock clock = [] { return absl::Now(); });

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /// @brief Current state; a fresh empty state for unknown ids
    absl::StatusOr<SessionState> Get(const std::string& session_id);

    /// @brief Append a turn, keeping only the last context_window turns
    absl::Status Append(const std::string& session_id, Turn turn);

    /// @brief Admit one request against the sliding window
    ///
    /// @return OK when admitted (the request is recorded), kRateLimited
    ///         otherwise (nothing is recorded)
    absl::Status CheckAndRecord(const std::string& session_id);

    /// @brief Drop the session's turns and rate-limit history
    absl::Status Reset(const std::string& session_id);

    SessionManagerStats GetStats() const;

    /// @brief Sessions with an operation in flight
    size_t ActiveSessionLocks() const;

    const SessionManagerConfig& config() const { return config_; }
    const SessionStore& store() const { return *store_; }

private:
    /// Holds one session's mutex; the map entry is dropped by the last holder
    class SessionLock {
    public:
        SessionLock(SessionManager* manager, const std::string& session_id);
        ~SessionLock();

        SessionLock(const SessionLock&) = delete;
        SessionLock& operator=(const SessionLock&) = delete;

    private:
        SessionManager* manager_;
        const std::string& session_id_;
        std::shared_ptr<std::mutex> mutex_;
    };

    std::shared_ptr<std::mutex> Acquire(const std::string& session_id);
    void Release(const std::string& session_id, std::shared_ptr<std::mutex> mutex);

    /// Load or create; caller holds the session lock
    absl::StatusOr<SessionState> Load(const std::string& session_id, absl::Time now,
                                      bool* created = nullptr);

    std::shared_ptr<SessionStore> store_;
    SessionManagerConfig config_;
    Clock clock_;

    mutable std::mutex locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> locks_;

    std::atomic<uint64_t> sessions_created_{0};
    std::atomic<uint64_t> requests_admitted_{0};
    std::atomic<uint64_t> requests_rate_limited_{0};
    std::atomic<uint64_t> resets_{0};
};

}  // namespace insightx::session
