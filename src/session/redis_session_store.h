#pragma once

/// @file redis_session_store.h
/// @brief Session store keeping each session as a JSON value in Redis

#include <chrono>
#include <memory>
#include <string>

#include "data/dataset_schema.h"
#include "session/session_store.h"
#include "storage/redis/client.h"

namespace insightx::session {

/// @brief Sessions stored under "insightx:session:<id>" with an expiry
///
/// Every Put refreshes the TTL, so the TTL acts as an idle timeout.
class RedisSessionStore : public SessionStore {
public:
    static constexpr const char* kKeyPrefix = "insightx:session:";

    RedisSessionStore(std::shared_ptr<storage::RedisClient> client,
                      std::chrono::seconds ttl = std::chrono::hours(24),
                      const data::DatasetSchema& schema = data::DatasetSchema::Default());

    absl::StatusOr<std::optional<SessionState>> Get(const std::string& session_id) override;
    absl::Status Put(const SessionState& state) override;
    absl::Status Evict(const std::string& session_id) override;
    std::string Name() const override { return "redis"; }

    static std::string KeyFor(const std::string& session_id);

private:
    std::shared_ptr<storage::RedisClient> client_;
    std::chrono::seconds ttl_;
    const data::DatasetSchema& schema_;
};

}  // namespace insightx::session
