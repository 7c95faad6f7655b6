#pragma once

/// @file session_store.h
/// @brief Keyed session storage capability

#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "session/session_state.h"

namespace insightx::session {

/// @brief Get/put/evict storage for SessionState keyed by session id
///
/// Stores do not serialise read-modify-write cycles; SessionManager holds a
/// per-session lock around them. Implementations must be safe to call from
/// several threads for different ids.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    /// @return nullopt when the session is unknown or expired
    virtual absl::StatusOr<std::optional<SessionState>> Get(const std::string& session_id) = 0;

    virtual absl::Status Put(const SessionState& state) = 0;

    /// @brief Remove a session; evicting an unknown id is not an error
    virtual absl::Status Evict(const std::string& session_id) = 0;

    /// @brief Store identifier for logs and health output ("memory", "redis")
    virtual std::string Name() const = 0;
};

}  // namespace insightx::session
