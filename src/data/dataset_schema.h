#pragma once

/// @file dataset_schema.h
/// @brief Fixed, versioned schema of the payment transaction dataset

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace insightx::data {

/// @brief Role a column plays in analysis
enum class ColumnKind {
    kIdentifier,
    kTimestamp,
    kMeasure,
    kDimension,
    kFlag
};

/// @brief Measurable vocabulary exposed to the intent extractor
enum class Metric {
    kAmount,
    kCount,
    kFailureRate,
    kFraudRate,
    kReviewRate
};

/// @brief Column definition
struct ColumnSpec {
    std::string name;
    ColumnKind kind = ColumnKind::kDimension;
    std::string description;

    /// Canonical spellings for dimension and flag columns (empty otherwise)
    std::vector<std::string> permitted_values;

    /// Whether the empty string is a legal value (failure_code on success rows)
    bool allows_empty = false;
};

/// @brief Metric definition
struct MetricSpec {
    Metric metric;
    std::string name;
    std::string label;
    std::string description;
};

std::string_view MetricName(Metric metric);

/// @brief Display label ("Failure Rate", "Transaction Count", ...)
std::string_view MetricLabel(Metric metric);
std::optional<Metric> ParseMetric(std::string_view name);
bool IsRateMetric(Metric metric);

/// @brief Schema of the `transactions` table
///
/// Everything the extractor may reference is enumerated here. Value lookups
/// are case-insensitive and return the canonical spelling, so "android" and
/// "ANDROID" both resolve to "Android" while "Blackberry" resolves to nothing.
class DatasetSchema {
public:
    /// @brief Schema version 1 of the payment dataset
    static const DatasetSchema& Default();

    DatasetSchema(int version, std::string table_name,
                  std::vector<ColumnSpec> columns,
                  std::vector<MetricSpec> metrics);

    int version() const { return version_; }
    const std::string& table_name() const { return table_name_; }
    const std::vector<ColumnSpec>& columns() const { return columns_; }
    const std::vector<MetricSpec>& metrics() const { return metrics_; }

    /// @brief Look up a column by name (case-insensitive)
    const ColumnSpec* FindColumn(std::string_view name) const;

    const MetricSpec* FindMetric(Metric metric) const;

    /// @brief True for dimension and flag columns, the only groupable ones
    bool IsGroupable(std::string_view column) const;

    /// @brief Names of all dimension columns, in schema order
    std::vector<std::string> DimensionNames() const;

    /// @brief Canonicalise a value for a dimension or flag column
    /// @return The schema spelling, or nullopt if the value is unknown
    std::optional<std::string> CanonicalValue(std::string_view column,
                                              std::string_view value) const;

    /// @brief Human-readable description embedded in model prompts
    std::string Describe() const;

private:
    int version_;
    std::string table_name_;
    std::vector<ColumnSpec> columns_;
    std::vector<MetricSpec> metrics_;
};

}  // namespace insightx::data
