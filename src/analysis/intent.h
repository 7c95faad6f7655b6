#pragma once

/// @file intent.h
/// @brief Structured, schema-validated query intent

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/civil_time.h>
#include <nlohmann/json.hpp>

#include "data/dataset_schema.h"

namespace insightx::analysis {

using data::Metric;

/// @brief Deterministic operations the analysis engine can execute
enum class Operation {
    kFailureRate,
    kAggregate,
    kCompareSegments,
    kTimeSeries,
    kTopFailureCodes,
    kExecutiveSummary,
    kUnsupported
};

enum class Reduction {
    kSum,
    kAvg,
    kCount,
    kMin,
    kMax
};

std::string_view OperationName(Operation op);
std::optional<Operation> ParseOperation(std::string_view name);
std::string_view ReductionName(Reduction reduction);
std::optional<Reduction> ParseReduction(std::string_view name);

/// @brief All executable operations (excludes kUnsupported)
const std::vector<Operation>& SupportedOperations();

/// @brief One predicate over a column
struct FilterConstraint {
    enum class Kind {
        kEquals,  ///< column = values[0]
        kIn,      ///< column IN values
        kRange    ///< min <= column <= max (either bound optional)
    };

    std::string column;
    Kind kind = Kind::kEquals;
    std::vector<std::string> values;
    std::optional<double> min;
    std::optional<double> max;

    /// @brief Predicate text, e.g. "device = 'Android'"
    std::string ToString() const;

    bool operator==(const FilterConstraint& other) const;
    bool operator!=(const FilterConstraint& other) const { return !(*this == other); }
};

using FilterSet = std::vector<FilterConstraint>;

/// @brief Filters joined with AND; "all transactions" when empty
std::string DescribeFilters(const FilterSet& filters);

/// @brief Short segment label, e.g. "Android" or "Android, 4G"
std::string SegmentLabel(const FilterSet& filters);

enum class RelativePeriod {
    kLast7Days,
    kLast30Days,
    kLast90Days
};

std::string_view RelativePeriodName(RelativePeriod period);
std::optional<RelativePeriod> ParseRelativePeriod(std::string_view name);
int RelativePeriodDays(RelativePeriod period);

/// @brief Requested time window
///
/// Either explicit inclusive dates (each bound optional) or a relative
/// period. Relative periods are anchored at the latest timestamp in the
/// dataset when the intent is resolved.
struct TimeRange {
    std::optional<absl::CivilDay> start;
    std::optional<absl::CivilDay> end;
    std::optional<RelativePeriod> period;

    std::string ToString() const;
    bool operator==(const TimeRange& other) const;
};

/// @brief Two filter sets compared by compare_segments
struct SegmentPair {
    FilterSet a;
    FilterSet b;

    bool operator==(const SegmentPair& other) const {
        return a == other.a && b == other.b;
    }
};

/// @brief A parsed question
///
/// Every column and value referenced by a valid intent belongs to the
/// dataset schema. Anything else is recorded in `unknown_terms` and the
/// operation becomes kUnsupported.
struct Intent {
    Operation operation = Operation::kUnsupported;
    std::optional<Metric> metric;
    std::optional<Reduction> reduction;
    FilterSet filters;
    std::vector<std::string> group_by;
    std::optional<TimeRange> time_range;
    std::optional<SegmentPair> segments;
    std::optional<size_t> top_k;

    double confidence = 0.0;
    bool inherits_context = false;

    std::vector<std::string> unknown_terms;
    std::string rejection_reason;

    bool IsUnsupported() const { return operation == Operation::kUnsupported; }

    bool operator==(const Intent& other) const;
};

nlohmann::json ToJson(const FilterConstraint& filter);
nlohmann::json ToJson(const Intent& intent);

/// @brief Build an intent from its JSON form, validating against the schema
///
/// Values are canonicalised to the schema spelling. Unknown operations,
/// metrics, columns and values do not fail the parse: they are collected in
/// `unknown_terms` and the intent is marked unsupported. Structurally broken
/// input (wrong types, not an object) fails with kDeserializationError.
absl::StatusOr<Intent> IntentFromJson(const nlohmann::json& json,
                                      const data::DatasetSchema& schema);

}  // namespace insightx::analysis
