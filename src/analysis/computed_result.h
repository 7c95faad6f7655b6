#pragma once

/// @file computed_result.h
/// @brief Deterministic analysis output, the only source of numeric truth

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/error.h"

namespace insightx::analysis {

enum class Unit {
    kCount,
    kCurrency,
    kPercent,
    kPercentagePoints
};

std::string_view UnitName(Unit unit);

/// @brief How a number was derived
struct Calculation {
    std::string formula;
    std::optional<double> numerator;
    std::optional<double> denominator;
    int64_t sample_size = 0;

    bool operator==(const Calculation& other) const {
        return formula == other.formula && numerator == other.numerator &&
               denominator == other.denominator && sample_size == other.sample_size;
    }
};

/// @brief One reported figure
///
/// An unavailable number has no value and an explanatory display string;
/// it is never rendered as zero.
struct NumberDetail {
    std::string label;
    std::optional<double> value;
    Unit unit = Unit::kCount;
    std::string display;
    Calculation calculation;

    /// Why the value is missing (kInsufficientData for an empty population)
    std::optional<ErrorCode> error_code;

    bool available() const { return value.has_value(); }

    bool operator==(const NumberDetail& other) const {
        return label == other.label && value == other.value && unit == other.unit &&
               display == other.display && calculation == other.calculation &&
               error_code == other.error_code;
    }
};

struct SeriesPoint {
    std::string x;
    double y = 0.0;
    std::string group;

    bool operator==(const SeriesPoint& other) const {
        return x == other.x && y == other.y && group == other.group;
    }
};

/// @brief Chart payload
struct ChartSeries {
    enum class Type { kBar, kLine };

    Type type = Type::kBar;
    std::string title;
    std::string x_label;
    std::string y_label;
    std::vector<SeriesPoint> points;

    bool operator==(const ChartSeries& other) const {
        return type == other.type && title == other.title && x_label == other.x_label &&
               y_label == other.y_label && points == other.points;
    }
};

/// @brief Exact description of the executed operation
struct QueryTrace {
    std::string operation;
    std::string predicate;
    std::string time_window;
    std::vector<std::string> group_by;
    std::string granularity;
    std::string formula;
    int64_t rows_scanned = 0;
    int64_t rows_matched = 0;
    double elapsed_ms = 0.0;

    /// @brief Single-line rendering, e.g. for the method explanation
    std::string ToString() const;

    /// Elapsed time is not part of equality
    bool operator==(const QueryTrace& other) const {
        return operation == other.operation && predicate == other.predicate &&
               time_window == other.time_window && group_by == other.group_by &&
               granularity == other.granularity && formula == other.formula &&
               rows_scanned == other.rows_scanned && rows_matched == other.rows_matched;
    }
};

struct ComputedResult {
    std::string metric;
    std::vector<NumberDetail> numbers;
    std::optional<ChartSeries> series;
    QueryTrace query_trace;

    /// @brief Short text stored with the session turn
    std::string Summary() const;

    bool operator==(const ComputedResult& other) const {
        return metric == other.metric && numbers == other.numbers &&
               series == other.series && query_trace == other.query_trace;
    }
    bool operator!=(const ComputedResult& other) const { return !(*this == other); }
};

nlohmann::json ToJson(const NumberDetail& number);
nlohmann::json ToJson(const ChartSeries& series);
nlohmann::json ToJson(const QueryTrace& trace);
nlohmann::json ToJson(const ComputedResult& result);

}  // namespace insightx::analysis
