/// @file session_manager.cpp
/// @brief Session manager implementation

#include "session/session_manager.h"

#include <algorithm>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::session {

namespace {

absl::Status CheckSessionId(const std::string& session_id) {
    if (session_id.empty()) {
        return absl::InvalidArgumentError("Session id must not be empty");
    }
    return absl::OkStatus();
}

}  // namespace

SessionManager::SessionManager(std::shared_ptr<SessionStore> store,
                               SessionManagerConfig config,
                               Clock clock)
    : store_(std::move(store)), config_(config), clock_(std::move(clock)) {}

std::shared_ptr<std::mutex> SessionManager::Acquire(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& entry = locks_[session_id];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

void SessionManager::Release(const std::string& session_id,
                             std::shared_ptr<std::mutex> mutex) {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto it = locks_.find(session_id);
    // The map and this holder are the only owners left
    if (it != locks_.end() && it->second == mutex && mutex.use_count() == 2) {
        locks_.erase(it);
    }
}

SessionManager::SessionLock::SessionLock(SessionManager* manager,
                                         const std::string& session_id)
    : manager_(manager), session_id_(session_id), mutex_(manager->Acquire(session_id)) {
    mutex_->lock();
}

SessionManager::SessionLock::~SessionLock() {
    mutex_->unlock();
    manager_->Release(session_id_, std::move(mutex_));
}

size_t SessionManager::ActiveSessionLocks() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return locks_.size();
}

absl::StatusOr<SessionState> SessionManager::Load(const std::string& session_id,
                                                  absl::Time now, bool* created) {
    INSIGHTX_ASSIGN_OR_RETURN(std::optional<SessionState> stored, store_->Get(session_id));
    if (created != nullptr) {
        *created = !stored.has_value();
    }
    if (stored) {
        return *std::move(stored);
    }
    SessionState state;
    state.session_id = session_id;
    state.created_at = now;
    state.last_active = now;
    return state;
}

absl::StatusOr<SessionState> SessionManager::Get(const std::string& session_id) {
    INSIGHTX_RETURN_IF_ERROR(CheckSessionId(session_id));
    SessionLock lock(this, session_id);
    return Load(session_id, clock_());
}

absl::Status SessionManager::Append(const std::string& session_id, Turn turn) {
    INSIGHTX_RETURN_IF_ERROR(CheckSessionId(session_id));
    SessionLock lock(this, session_id);

    absl::Time now = clock_();
    INSIGHTX_ASSIGN_OR_RETURN(SessionState state, Load(session_id, now));

    if (turn.timestamp == absl::UnixEpoch()) {
        turn.timestamp = now;
    }
    state.turns.push_back(std::move(turn));
    if (state.turns.size() > config_.context_window) {
        state.turns.erase(state.turns.begin(),
                          state.turns.end() - static_cast<ptrdiff_t>(config_.context_window));
    }
    state.last_active = now;
    return store_->Put(state);
}

absl::Status SessionManager::CheckAndRecord(const std::string& session_id) {
    INSIGHTX_RETURN_IF_ERROR(CheckSessionId(session_id));
    SessionLock lock(this, session_id);

    absl::Time now = clock_();
    bool created = false;
    INSIGHTX_ASSIGN_OR_RETURN(SessionState state, Load(session_id, now, &created));

    // Timestamps at or before now - window have left the window
    absl::Time window_start = now - config_.rate_window;
    auto& timestamps = state.request_timestamps;
    timestamps.erase(std::remove_if(timestamps.begin(), timestamps.end(),
                                    [window_start](absl::Time t) { return t <= window_start; }),
                     timestamps.end());

    if (timestamps.size() >= config_.requests_per_minute) {
        requests_rate_limited_.fetch_add(1, std::memory_order_relaxed);
        INSIGHTX_LOG_INFO("Session {} rate limited ({} requests in {})", session_id,
                          timestamps.size(), absl::FormatDuration(config_.rate_window));
        return RateLimitedError(absl::StrCat("At most ", config_.requests_per_minute,
                                             " requests per ",
                                             absl::FormatDuration(config_.rate_window)));
    }

    timestamps.push_back(now);
    state.last_active = now;
    INSIGHTX_RETURN_IF_ERROR(store_->Put(state));

    if (created) {
        sessions_created_.fetch_add(1, std::memory_order_relaxed);
    }
    requests_admitted_.fetch_add(1, std::memory_order_relaxed);
    return absl::OkStatus();
}

absl::Status SessionManager::Reset(const std::string& session_id) {
    INSIGHTX_RETURN_IF_ERROR(CheckSessionId(session_id));
    SessionLock lock(this, session_id);

    INSIGHTX_RETURN_IF_ERROR(store_->Evict(session_id));
    resets_.fetch_add(1, std::memory_order_relaxed);
    INSIGHTX_LOG_INFO("Session {} reset", session_id);
    return absl::OkStatus();
}

SessionManagerStats SessionManager::GetStats() const {
    SessionManagerStats stats;
    stats.sessions_created = sessions_created_.load(std::memory_order_relaxed);
    stats.requests_admitted = requests_admitted_.load(std::memory_order_relaxed);
    stats.requests_rate_limited = requests_rate_limited_.load(std::memory_order_relaxed);
    stats.resets = resets_.load(std::memory_order_relaxed);
    return stats;
}

}  // namespace insightx::session
