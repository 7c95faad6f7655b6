#pragma once

/// @file analysis_engine.h
/// @brief Deterministic operation catalog over the transaction table

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "analysis/computed_result.h"
#include "analysis/intent.h"
#include "data/transaction_table.h"

namespace insightx::analysis {

/// @brief Configuration for the analysis engine
struct AnalysisEngineConfig {
    /// Default truncation for top_failure_codes
    size_t default_top_k = 5;

    /// Upper bound on a requested top_k
    size_t max_top_k = 20;

    /// Wall-clock budget per operation, checked while scanning
    std::chrono::milliseconds query_timeout{2000};
};

/// @brief Time window after clamping to the dataset's timestamp domain
struct ResolvedWindow {
    absl::CivilDay first_day;
    absl::CivilDay last_day;  ///< inclusive
    bool explicit_range = false;

    /// @brief Number of days covered; zero when the window is empty
    int64_t SpanDays() const;
    bool empty() const { return last_day < first_day; }
    std::string ToString() const;
};

/// @brief Bucket size for time series
enum class Granularity {
    kDay,
    kWeek,
    kMonth
};

std::string_view GranularityName(Granularity granularity);

/// @brief day for spans up to 31 days, week up to 180, month beyond
Granularity GranularityForSpan(int64_t span_days);

/// @brief True if no transaction can satisfy both filter sets
///
/// Two sets are disjoint when some column is constrained in both with no
/// value (or no amount) in common.
bool SegmentsDisjoint(const FilterSet& a, const FilterSet& b);

/// @brief Executes validated intents against an immutable table
///
/// Every operation is a pure function of (intent, table snapshot): the same
/// inputs produce an equal ComputedResult. Only elapsed time varies.
///
/// Example usage:
/// @code
///   AnalysisEngine engine(table);
///   Intent intent;
///   intent.operation = Operation::kFailureRate;
///   auto result = engine.Resolve(intent);
///   // result->numbers[0] = {"Failure Rate", 3.45, percent, "3.45%", 345/10000}
/// @endcode
class AnalysisEngine {
public:
    explicit AnalysisEngine(std::shared_ptr<const data::TransactionTable> table,
                            AnalysisEngineConfig config = {});
    ~AnalysisEngine();

    AnalysisEngine(const AnalysisEngine&) = delete;
    AnalysisEngine& operator=(const AnalysisEngine&) = delete;

    /// @brief Structural validation, no data access
    ///
    /// @return kUnsupportedOperation for unsupported intents, kInvalidArgument
    ///         for intents missing what their operation needs
    absl::Status Validate(const Intent& intent) const;

    /// @brief Validate and execute an intent
    ///
    /// @return kInvalidFilter when filters or the time range select no rows,
    ///         kResourceExhausted when the query budget is exceeded
    absl::StatusOr<ComputedResult> Resolve(const Intent& intent) const;

    /// @brief Clamp a requested range to the dataset's timestamp domain
    ResolvedWindow NormalizeTimeRange(const TimeRange& range) const;

    const data::TransactionTable& table() const { return *table_; }
    const AnalysisEngineConfig& config() const { return config_; }

private:
    class Query;

    std::shared_ptr<const data::TransactionTable> table_;
    AnalysisEngineConfig config_;
};

}  // namespace insightx::analysis
