/// @file redis_session_store.cpp
/// @brief Redis session store implementation

#include "session/redis_session_store.h"

#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::session {

using json = nlohmann::json;

RedisSessionStore::RedisSessionStore(std::shared_ptr<storage::RedisClient> client,
                                     std::chrono::seconds ttl,
                                     const data::DatasetSchema& schema)
    : client_(std::move(client)), ttl_(ttl), schema_(schema) {}

std::string RedisSessionStore::KeyFor(const std::string& session_id) {
    return absl::StrCat(kKeyPrefix, session_id);
}

absl::StatusOr<std::optional<SessionState>> RedisSessionStore::Get(
    const std::string& session_id) {
    INSIGHTX_ASSIGN_OR_RETURN(std::optional<std::string> value,
                              client_->Get(KeyFor(session_id)));
    if (!value) {
        return std::optional<SessionState>();
    }

    json document = json::parse(*value, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Stored session ", session_id, " is not valid JSON"));
    }
    INSIGHTX_ASSIGN_OR_RETURN(SessionState state, SessionStateFromJson(document, schema_));
    return std::optional<SessionState>(std::move(state));
}

absl::Status RedisSessionStore::Put(const SessionState& state) {
    return client_->Set(KeyFor(state.session_id), ToJson(state).dump(), ttl_);
}

absl::Status RedisSessionStore::Evict(const std::string& session_id) {
    INSIGHTX_ASSIGN_OR_RETURN(bool deleted, client_->Delete(KeyFor(session_id)));
    if (deleted) {
        INSIGHTX_LOG_DEBUG("Evicted session {} from Redis", session_id);
    }
    return absl::OkStatus();
}

}  // namespace insightx::session
