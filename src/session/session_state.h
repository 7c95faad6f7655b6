#pragma once

/// @file session_state.h
/// @brief Conversational state of one chat session

#include <string>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <nlohmann/json.hpp>

#include "analysis/intent.h"
#include "data/dataset_schema.h"

namespace insightx::session {

/// @brief One answered request, as remembered for follow-up questions
struct Turn {
    std::string question;
    analysis::Intent intent;

    /// Answer kind that ended the turn ("analysis", "clarification", ...)
    std::string answer_kind;

    /// Headline figures of the answer, empty unless answer_kind is "analysis"
    std::string result_summary;

    absl::Time timestamp = absl::UnixEpoch();

    bool IsAnalysis() const { return answer_kind == "analysis"; }
};

/// @brief Per-session state held in a SessionStore
struct SessionState {
    std::string session_id;

    /// Most recent turns, oldest first; bounded by the context window
    std::vector<Turn> turns;

    /// Admission times inside the rate-limit window, oldest first
    std::vector<absl::Time> request_timestamps;

    absl::Time created_at = absl::UnixEpoch();
    absl::Time last_active = absl::UnixEpoch();
};

nlohmann::json ToJson(const Turn& turn);
nlohmann::json ToJson(const SessionState& state);

/// @brief Restore a session from its stored JSON form
/// @return kDeserializationError if the document is malformed
absl::StatusOr<SessionState> SessionStateFromJson(
    const nlohmann::json& json,
    const data::DatasetSchema& schema = data::DatasetSchema::Default());

}  // namespace insightx::session
