/// @file session_state.cpp
/// @brief SessionState serialisation

#include "session/session_state.h"

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace insightx::session {

using json = nlohmann::json;

json ToJson(const Turn& turn) {
    return {
        {"question", turn.question},
        {"intent", analysis::ToJson(turn.intent)},
        {"answer_kind", turn.answer_kind},
        {"result_summary", turn.result_summary},
        {"timestamp_ms", absl::ToUnixMillis(turn.timestamp)},
    };
}

json ToJson(const SessionState& state) {
    json turns = json::array();
    for (const auto& turn : state.turns) {
        turns.push_back(ToJson(turn));
    }
    json requests = json::array();
    for (const auto& ts : state.request_timestamps) {
        requests.push_back(absl::ToUnixMillis(ts));
    }
    return {
        {"session_id", state.session_id},
        {"turns", std::move(turns)},
        {"request_timestamps_ms", std::move(requests)},
        {"created_at_ms", absl::ToUnixMillis(state.created_at)},
        {"last_active_ms", absl::ToUnixMillis(state.last_active)},
    };
}

absl::StatusOr<SessionState> SessionStateFromJson(const json& j,
                                                  const data::DatasetSchema& schema) {
    SessionState state;
    try {
        state.session_id = j.at("session_id").get<std::string>();
        state.created_at = absl::FromUnixMillis(j.at("created_at_ms").get<int64_t>());
        state.last_active = absl::FromUnixMillis(j.at("last_active_ms").get<int64_t>());

        for (const auto& ms : j.at("request_timestamps_ms")) {
            state.request_timestamps.push_back(absl::FromUnixMillis(ms.get<int64_t>()));
        }

        for (const auto& item : j.at("turns")) {
            Turn turn;
            turn.question = item.at("question").get<std::string>();
            turn.answer_kind = item.at("answer_kind").get<std::string>();
            turn.result_summary = item.value("result_summary", std::string());
            turn.timestamp = absl::FromUnixMillis(item.at("timestamp_ms").get<int64_t>());
            INSIGHTX_ASSIGN_OR_RETURN(turn.intent,
                                      analysis::IntentFromJson(item.at("intent"), schema));
            state.turns.push_back(std::move(turn));
        }
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Malformed session state: ", e.what()));
    }
    return state;
}

}  // namespace insightx::session
