/// @file analysis_engine.cpp
/// @brief Analysis engine implementation
///
/// Operations scan the table once to select the filtered population, then
/// aggregate over row indices. The wall-clock budget is checked every
/// kDeadlineCheckInterval rows of every loop.

#include "analysis/analysis_engine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "analysis/formatting.h"
#include "common/error.h"
#include "common/logging.h"

namespace insightx::analysis {

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kDeadlineCheckInterval = 4096;
constexpr const char* kInsufficientData = "insufficient data";
constexpr const char* kUnknownFailureCode = "UNKNOWN";

/// @brief Running totals for every metric over a set of rows
struct Accumulator {
    int64_t count = 0;
    int64_t failed = 0;
    int64_t fraud = 0;
    int64_t review = 0;
    double sum = 0.0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();

    void Add(const data::TransactionTable& table, size_t row) {
        ++count;
        failed += table.failed(row) ? 1 : 0;
        fraud += table.fraud(row) ? 1 : 0;
        review += table.review(row) ? 1 : 0;
        double amount = table.amount(row);
        sum += amount;
        min = std::min(min, amount);
        max = std::max(max, amount);
    }
};

/// @brief Filter set compiled against the table's dictionaries
class RowPredicate {
public:
    static absl::StatusOr<RowPredicate> Compile(const data::TransactionTable& table,
                                                const FilterSet& filters) {
        RowPredicate predicate;
        for (const auto& filter : filters) {
            if (filter.kind == FilterConstraint::Kind::kRange) {
                if (filter.column != "amount") {
                    return absl::InvalidArgumentError(
                        absl::StrCat("Range filters apply to amount only, got ", filter.column));
                }
                predicate.ranges_.push_back({filter.min, filter.max});
                continue;
            }
            auto column = table.CategoricalIndex(filter.column);
            if (!column) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Column cannot be filtered: ", filter.column));
            }
            Categorical categorical;
            categorical.column = *column;
            categorical.allowed.assign(table.Cardinality(*column), false);
            for (const auto& value : filter.values) {
                // A schema value absent from the data matches nothing
                if (auto code = table.CodeOf(*column, value)) {
                    categorical.allowed[*code] = true;
                }
            }
            predicate.categorical_.push_back(std::move(categorical));
        }
        return predicate;
    }

    bool Matches(const data::TransactionTable& table, size_t row) const {
        for (const auto& categorical : categorical_) {
            if (!categorical.allowed[table.code(categorical.column, row)]) {
                return false;
            }
        }
        for (const auto& range : ranges_) {
            double amount = table.amount(row);
            if ((range.min && amount < *range.min) || (range.max && amount > *range.max)) {
                return false;
            }
        }
        return true;
    }

private:
    struct Categorical {
        size_t column = 0;
        std::vector<bool> allowed;
    };
    struct AmountRange {
        std::optional<double> min;
        std::optional<double> max;
    };

    std::vector<Categorical> categorical_;
    std::vector<AmountRange> ranges_;
};

Reduction EffectiveReduction(Metric metric, const std::optional<Reduction>& reduction) {
    if (metric != Metric::kAmount) {
        return Reduction::kCount;
    }
    return reduction.value_or(Reduction::kSum);
}

std::string ResultMetricName(Metric metric, Reduction reduction) {
    if (metric == Metric::kAmount) {
        return absl::StrCat("amount_", ReductionName(reduction));
    }
    return std::string(data::MetricName(metric));
}

std::string BaseLabel(Metric metric, Reduction reduction) {
    if (metric == Metric::kAmount) {
        switch (reduction) {
            case Reduction::kSum: return "Total Amount";
            case Reduction::kAvg: return "Average Amount";
            case Reduction::kCount: return "Transaction Count";
            case Reduction::kMin: return "Minimum Amount";
            case Reduction::kMax: return "Maximum Amount";
        }
    }
    return std::string(data::MetricLabel(metric));
}

std::string Formula(Metric metric, Reduction reduction) {
    switch (metric) {
        case Metric::kAmount:
            switch (reduction) {
                case Reduction::kSum: return "SUM(amount)";
                case Reduction::kAvg: return "AVG(amount)";
                case Reduction::kCount: return "COUNT(*)";
                case Reduction::kMin: return "MIN(amount)";
                case Reduction::kMax: return "MAX(amount)";
            }
            break;
        case Metric::kCount:
            return "COUNT(*)";
        case Metric::kFailureRate:
            return "100 * COUNT(status = 'Failed') / COUNT(*)";
        case Metric::kFraudRate:
            return "100 * COUNT(fraud_flag = 1) / COUNT(*)";
        case Metric::kReviewRate:
            return "100 * COUNT(review_flag = 1) / COUNT(*)";
    }
    return "COUNT(*)";
}

Unit UnitFor(Metric metric, Reduction reduction) {
    if (data::IsRateMetric(metric)) {
        return Unit::kPercent;
    }
    if (metric == Metric::kAmount && reduction != Reduction::kCount) {
        return Unit::kCurrency;
    }
    return Unit::kCount;
}

int DisplayDecimals(Metric metric, Reduction reduction) {
    if (metric == Metric::kFraudRate) {
        return 4;
    }
    return UnitFor(metric, reduction) == Unit::kCount ? 0 : 2;
}

std::string Display(Unit unit, double value, int decimals) {
    switch (unit) {
        case Unit::kCount: return FormatCount(value);
        case Unit::kCurrency: return FormatCurrency(value);
        case Unit::kPercent: return FormatPercent(value, decimals);
        case Unit::kPercentagePoints: return FormatPercentagePoints(value, decimals);
    }
    return FormatNumber(value, decimals);
}

std::string Signed(double value, std::string text) {
    return value > 0 ? absl::StrCat("+", text) : text;
}

/// @brief Compute one metric over an accumulator
NumberDetail MetricNumber(std::string label, Metric metric, Reduction reduction,
                          const Accumulator& acc) {
    NumberDetail number;
    number.label = std::move(label);
    number.unit = UnitFor(metric, reduction);
    number.calculation.formula = Formula(metric, reduction);
    number.calculation.sample_size = acc.count;

    if (acc.count == 0) {
        number.display = kInsufficientData;
        number.error_code = ErrorCode::kInsufficientData;
        return number;
    }

    int decimals = DisplayDecimals(metric, reduction);
    double count = static_cast<double>(acc.count);

    switch (metric) {
        case Metric::kCount:
            number.value = count;
            break;
        case Metric::kAmount:
            switch (reduction) {
                case Reduction::kSum: number.value = RoundTo(acc.sum, 2); break;
                case Reduction::kAvg: number.value = RoundTo(acc.sum / count, 2); break;
                case Reduction::kCount: number.value = count; break;
                case Reduction::kMin: number.value = RoundTo(acc.min, 2); break;
                case Reduction::kMax: number.value = RoundTo(acc.max, 2); break;
            }
            break;
        case Metric::kFailureRate:
        case Metric::kFraudRate:
        case Metric::kReviewRate: {
            int64_t hits = metric == Metric::kFailureRate ? acc.failed
                         : metric == Metric::kFraudRate   ? acc.fraud
                                                          : acc.review;
            number.calculation.numerator = static_cast<double>(hits);
            number.calculation.denominator = count;
            number.value = RoundTo(100.0 * static_cast<double>(hits) / count, decimals);
            break;
        }
    }
    number.display = Display(number.unit, *number.value, decimals);
    return number;
}

NumberDetail UnavailableNumber(std::string label, Unit unit, std::string formula) {
    NumberDetail number;
    number.label = std::move(label);
    number.unit = unit;
    number.display = kInsufficientData;
    number.error_code = ErrorCode::kInsufficientData;
    number.calculation.formula = std::move(formula);
    return number;
}

absl::Time StartOfDay(absl::CivilDay day) {
    return absl::FromCivil(absl::CivilSecond(day), absl::UTCTimeZone());
}

std::string BucketKey(absl::Time timestamp, Granularity granularity) {
    absl::CivilDay day = absl::ToCivilDay(timestamp, absl::UTCTimeZone());
    switch (granularity) {
        case Granularity::kDay:
            return absl::FormatCivilTime(day);
        case Granularity::kWeek:
            // Weeks start on Monday
            return absl::FormatCivilTime(absl::PrevWeekday(day + 1, absl::Weekday::monday));
        case Granularity::kMonth:
            return absl::FormatCivilTime(absl::CivilMonth(day));
    }
    return absl::FormatCivilTime(day);
}

bool ValuesOverlap(const FilterConstraint& a, const FilterConstraint& b) {
    if (a.kind == FilterConstraint::Kind::kRange && b.kind == FilterConstraint::Kind::kRange) {
        if (a.max && b.min && *a.max < *b.min) return false;
        if (b.max && a.min && *b.max < *a.min) return false;
        return true;
    }
    if (a.kind == FilterConstraint::Kind::kRange || b.kind == FilterConstraint::Kind::kRange) {
        return true;
    }
    for (const auto& value : a.values) {
        if (std::find(b.values.begin(), b.values.end(), value) != b.values.end()) {
            return true;
        }
    }
    return false;
}

}  // namespace

// =============================================================================
// Free functions
// =============================================================================

int64_t ResolvedWindow::SpanDays() const {
    return empty() ? 0 : static_cast<int64_t>(last_day - first_day) + 1;
}

std::string ResolvedWindow::ToString() const {
    return absl::StrCat(absl::FormatCivilTime(first_day), " to ",
                        absl::FormatCivilTime(last_day));
}

std::string_view GranularityName(Granularity granularity) {
    switch (granularity) {
        case Granularity::kDay: return "day";
        case Granularity::kWeek: return "week";
        case Granularity::kMonth: return "month";
    }
    return "day";
}

Granularity GranularityForSpan(int64_t span_days) {
    if (span_days <= 31) return Granularity::kDay;
    if (span_days <= 180) return Granularity::kWeek;
    return Granularity::kMonth;
}

bool SegmentsDisjoint(const FilterSet& a, const FilterSet& b) {
    for (const auto& fa : a) {
        for (const auto& fb : b) {
            if (fa.column == fb.column && !ValuesOverlap(fa, fb)) {
                return true;
            }
        }
    }
    return false;
}

// =============================================================================
// Query: state of one Resolve() call
// =============================================================================

class AnalysisEngine::Query {
public:
    Query(const AnalysisEngine& engine, const Intent& intent)
        : engine_(engine),
          table_(*engine.table_),
          intent_(intent),
          started_(Clock::now()),
          deadline_(started_ + engine.config_.query_timeout) {
        if (intent.time_range) {
            window_ = engine.NormalizeTimeRange(*intent.time_range);
        }
    }

    absl::StatusOr<ComputedResult> Run() {
        switch (intent_.operation) {
            case Operation::kFailureRate:
                return RunMetric(Metric::kFailureRate, Reduction::kCount);
            case Operation::kAggregate: {
                Metric metric = intent_.metric.value_or(Metric::kCount);
                return RunMetric(metric, EffectiveReduction(metric, intent_.reduction));
            }
            case Operation::kCompareSegments:
                return RunCompare();
            case Operation::kTimeSeries:
                return RunTimeSeries();
            case Operation::kTopFailureCodes:
                return RunTopFailureCodes();
            case Operation::kExecutiveSummary:
                return RunExecutiveSummary();
            case Operation::kUnsupported:
                break;
        }
        return UnsupportedOperationError("Unsupported operation");
    }

private:
    absl::Status CheckBudget(size_t iteration) const {
        if (iteration % kDeadlineCheckInterval == 0 && Clock::now() >= deadline_) {
            return ResourceExhaustedError(
                absl::StrCat("Query exceeded its ", engine_.config_.query_timeout.count(),
                             " ms budget"));
        }
        return absl::OkStatus();
    }

    /// @brief Rows passing the intent's filters and time window
    absl::StatusOr<std::vector<uint32_t>> SelectBase() {
        INSIGHTX_ASSIGN_OR_RETURN(RowPredicate predicate,
                                  RowPredicate::Compile(table_, intent_.filters));
        std::vector<uint32_t> rows;
        if (window_ && window_->empty()) {
            return rows;
        }

        absl::Time start = absl::InfinitePast();
        absl::Time end = absl::InfiniteFuture();
        if (window_) {
            start = StartOfDay(window_->first_day);
            end = StartOfDay(window_->last_day + 1);
        }

        for (size_t row = 0; row < table_.size(); ++row) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(row));
            absl::Time timestamp = table_.timestamp(row);
            if (timestamp < start || timestamp >= end) {
                continue;
            }
            if (predicate.Matches(table_, row)) {
                rows.push_back(static_cast<uint32_t>(row));
            }
        }
        return rows;
    }

    /// @brief Subset of `rows` passing an additional filter set
    absl::StatusOr<std::vector<uint32_t>> Refine(const std::vector<uint32_t>& rows,
                                                 const FilterSet& filters) {
        INSIGHTX_ASSIGN_OR_RETURN(RowPredicate predicate,
                                  RowPredicate::Compile(table_, filters));
        std::vector<uint32_t> refined;
        for (size_t i = 0; i < rows.size(); ++i) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(i));
            if (predicate.Matches(table_, rows[i])) {
                refined.push_back(rows[i]);
            }
        }
        return refined;
    }

    absl::StatusOr<Accumulator> Accumulate(const std::vector<uint32_t>& rows) {
        Accumulator acc;
        for (size_t i = 0; i < rows.size(); ++i) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(i));
            acc.Add(table_, rows[i]);
        }
        return acc;
    }

    /// @brief Empty populations are an error only when the user narrowed them
    absl::Status RequireNonEmpty(const std::vector<uint32_t>& rows) const {
        if (!rows.empty() || (intent_.filters.empty() && !intent_.time_range)) {
            return absl::OkStatus();
        }
        std::string message = intent_.filters.empty()
                                  ? std::string("No transactions")
                                  : absl::StrCat("No transactions match ",
                                                 DescribeFilters(intent_.filters));
        if (window_) {
            if (window_->empty()) {
                absl::StrAppend(&message, " in ", intent_.time_range->ToString(),
                                " (data covers ",
                                absl::FormatTime("%Y-%m-%d", table_.domain().min,
                                                 absl::UTCTimeZone()),
                                " to ",
                                absl::FormatTime("%Y-%m-%d", table_.domain().max,
                                                 absl::UTCTimeZone()),
                                ")");
            } else {
                absl::StrAppend(&message, " between ", window_->ToString());
            }
        }
        return InvalidFilterError(message);
    }

    using GroupedRows = std::vector<std::pair<std::string, Accumulator>>;

    /// @brief Aggregate rows per group key, ordered lexically by key text
    absl::StatusOr<GroupedRows> Group(const std::vector<uint32_t>& rows,
                                      const std::vector<std::string>& columns) {
        std::vector<size_t> indexes;
        for (const auto& column : columns) {
            auto index = table_.CategoricalIndex(column);
            if (!index) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Column cannot be grouped: ", column));
            }
            indexes.push_back(*index);
        }

        std::map<std::vector<uint16_t>, Accumulator> by_code;
        std::vector<uint16_t> key(indexes.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(i));
            for (size_t c = 0; c < indexes.size(); ++c) {
                key[c] = table_.code(indexes[c], rows[i]);
            }
            by_code[key].Add(table_, rows[i]);
        }

        GroupedRows grouped;
        grouped.reserve(by_code.size());
        for (const auto& [codes, acc] : by_code) {
            std::vector<std::string> parts;
            for (size_t c = 0; c < codes.size(); ++c) {
                parts.push_back(table_.Decode(indexes[c], codes[c]));
            }
            grouped.emplace_back(absl::StrJoin(parts, " / "), acc);
        }
        std::sort(grouped.begin(), grouped.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        return grouped;
    }

    absl::StatusOr<ComputedResult> RunMetric(Metric metric, Reduction reduction) {
        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows, SelectBase());
        INSIGHTX_RETURN_IF_ERROR(RequireNonEmpty(rows));

        ComputedResult result;
        result.metric = ResultMetricName(metric, reduction);
        std::string label = BaseLabel(metric, reduction);

        if (intent_.group_by.empty()) {
            INSIGHTX_ASSIGN_OR_RETURN(Accumulator acc, Accumulate(rows));
            result.numbers.push_back(MetricNumber(label, metric, reduction, acc));
        } else {
            INSIGHTX_ASSIGN_OR_RETURN(GroupedRows groups, Group(rows, intent_.group_by));
            ChartSeries chart;
            chart.type = ChartSeries::Type::kBar;
            chart.title = absl::StrCat(label, " by ", absl::StrJoin(intent_.group_by, ", "));
            chart.x_label = absl::StrJoin(intent_.group_by, " / ");
            chart.y_label = label;
            for (const auto& [key, acc] : groups) {
                NumberDetail number =
                    MetricNumber(absl::StrCat(label, " (", key, ")"), metric, reduction, acc);
                if (number.value) {
                    chart.points.push_back({key, *number.value, ""});
                }
                result.numbers.push_back(std::move(number));
            }
            result.series = std::move(chart);
        }

        Finish(result, Formula(metric, reduction), rows.size());
        return result;
    }

    absl::StatusOr<ComputedResult> RunCompare() {
        const SegmentPair& segments = *intent_.segments;
        Metric metric = intent_.metric.value_or(Metric::kFailureRate);
        Reduction reduction = EffectiveReduction(metric, intent_.reduction);

        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> base, SelectBase());
        INSIGHTX_RETURN_IF_ERROR(RequireNonEmpty(base));
        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows_a, Refine(base, segments.a));
        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows_b, Refine(base, segments.b));
        INSIGHTX_ASSIGN_OR_RETURN(Accumulator acc_a, Accumulate(rows_a));
        INSIGHTX_ASSIGN_OR_RETURN(Accumulator acc_b, Accumulate(rows_b));

        std::string label = BaseLabel(metric, reduction);
        std::string label_a = SegmentLabel(segments.a);
        std::string label_b = SegmentLabel(segments.b);

        NumberDetail a = MetricNumber(absl::StrCat(label, " (", label_a, ")"),
                                      metric, reduction, acc_a);
        NumberDetail b = MetricNumber(absl::StrCat(label, " (", label_b, ")"),
                                      metric, reduction, acc_b);
        if (!a.available()) a.display = "insufficient data (no matching transactions)";
        if (!b.available()) b.display = "insufficient data (no matching transactions)";

        Unit value_unit = UnitFor(metric, reduction);
        Unit diff_unit = value_unit == Unit::kPercent ? Unit::kPercentagePoints : value_unit;
        int decimals = DisplayDecimals(metric, reduction);
        std::string diff_label = absl::StrCat("Difference (", label_a, " vs ", label_b, ")");
        std::string diff_formula = absl::StrCat("(", label_a, ") - (", label_b, ")");
        std::string rel_label = absl::StrCat("Relative Difference (", label_a, " vs ", label_b, ")");
        std::string rel_formula = absl::StrCat("100 * ((", label_a, ") - (", label_b, ")) / (",
                                               label_b, ")");

        ComputedResult result;
        result.metric = ResultMetricName(metric, reduction);

        ChartSeries chart;
        chart.type = ChartSeries::Type::kBar;
        chart.title = absl::StrCat(label, ": ", label_a, " vs ", label_b);
        chart.x_label = "segment";
        chart.y_label = label;
        if (a.value) chart.points.push_back({label_a, *a.value, ""});
        if (b.value) chart.points.push_back({label_b, *b.value, ""});

        if (a.available() && b.available()) {
            double diff = RoundTo(*a.value - *b.value, decimals);
            NumberDetail difference;
            difference.label = diff_label;
            difference.value = diff;
            difference.unit = diff_unit;
            difference.display = diff_unit == Unit::kPercentagePoints
                                     ? Display(diff_unit, diff, decimals)
                                     : Signed(diff, Display(diff_unit, diff, decimals));
            difference.calculation.formula = diff_formula;
            difference.calculation.sample_size = acc_a.count + acc_b.count;

            NumberDetail relative;
            if (*b.value != 0.0) {
                double rel = RoundTo(100.0 * (*a.value - *b.value) / *b.value, 2);
                relative.label = rel_label;
                relative.value = rel;
                relative.unit = Unit::kPercent;
                relative.display = Signed(rel, FormatPercent(rel, 2));
                relative.calculation.formula = rel_formula;
                relative.calculation.sample_size = acc_a.count + acc_b.count;
            } else {
                relative = UnavailableNumber(rel_label, Unit::kPercent, rel_formula);
            }

            result.numbers = {std::move(a), std::move(b), std::move(difference),
                              std::move(relative)};
        } else {
            result.numbers = {std::move(a), std::move(b),
                              UnavailableNumber(diff_label, diff_unit, diff_formula),
                              UnavailableNumber(rel_label, Unit::kPercent, rel_formula)};
        }
        result.series = std::move(chart);

        Finish(result, Formula(metric, reduction), base.size());
        result.query_trace.predicate =
            absl::StrCat(DescribeFilters(intent_.filters), "; A: ",
                         DescribeFilters(segments.a), "; B: ", DescribeFilters(segments.b));
        return result;
    }

    absl::StatusOr<ComputedResult> RunTimeSeries() {
        Metric metric = intent_.metric.value_or(Metric::kCount);
        Reduction reduction = EffectiveReduction(metric, intent_.reduction);

        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows, SelectBase());
        INSIGHTX_RETURN_IF_ERROR(RequireNonEmpty(rows));

        int64_t span = 0;
        if (window_) {
            span = window_->SpanDays();
        } else if (!table_.empty()) {
            absl::CivilDay first = absl::ToCivilDay(table_.domain().min, absl::UTCTimeZone());
            absl::CivilDay last = absl::ToCivilDay(table_.domain().max, absl::UTCTimeZone());
            span = static_cast<int64_t>(last - first) + 1;
        }
        Granularity granularity = GranularityForSpan(span);

        std::vector<size_t> group_indexes;
        for (const auto& column : intent_.group_by) {
            auto index = table_.CategoricalIndex(column);
            if (!index) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Column cannot be grouped: ", column));
            }
            group_indexes.push_back(*index);
        }

        std::map<std::pair<std::string, std::vector<uint16_t>>, Accumulator> buckets;
        std::vector<uint16_t> codes(group_indexes.size());
        for (size_t i = 0; i < rows.size(); ++i) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(i));
            uint32_t row = rows[i];
            for (size_t c = 0; c < group_indexes.size(); ++c) {
                codes[c] = table_.code(group_indexes[c], row);
            }
            buckets[{BucketKey(table_.timestamp(row), granularity), codes}].Add(table_, row);
        }

        std::vector<std::tuple<std::string, std::string, Accumulator>> ordered;
        ordered.reserve(buckets.size());
        for (const auto& [key, acc] : buckets) {
            std::vector<std::string> parts;
            for (size_t c = 0; c < key.second.size(); ++c) {
                parts.push_back(table_.Decode(group_indexes[c], key.second[c]));
            }
            ordered.emplace_back(key.first, absl::StrJoin(parts, " / "), acc);
        }
        std::sort(ordered.begin(), ordered.end(), [](const auto& a, const auto& b) {
            return std::tie(std::get<0>(a), std::get<1>(a)) <
                   std::tie(std::get<0>(b), std::get<1>(b));
        });

        std::string label = BaseLabel(metric, reduction);
        ComputedResult result;
        result.metric = ResultMetricName(metric, reduction);

        ChartSeries chart;
        chart.type = ChartSeries::Type::kLine;
        chart.title = absl::StrCat(label, " per ", GranularityName(granularity));
        chart.x_label = std::string(GranularityName(granularity));
        chart.y_label = label;

        for (const auto& [bucket, group, acc] : ordered) {
            std::string number_label =
                group.empty() ? bucket : absl::StrCat(bucket, " (", group, ")");
            NumberDetail number = MetricNumber(number_label, metric, reduction, acc);
            if (number.value) {
                chart.points.push_back({bucket, *number.value, group});
            }
            result.numbers.push_back(std::move(number));
        }
        result.series = std::move(chart);

        Finish(result, Formula(metric, reduction), rows.size());
        result.query_trace.granularity = std::string(GranularityName(granularity));
        return result;
    }

    absl::StatusOr<ComputedResult> RunTopFailureCodes() {
        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows, SelectBase());
        INSIGHTX_RETURN_IF_ERROR(RequireNonEmpty(rows));

        auto code_column = table_.CategoricalIndex("failure_code");
        if (!code_column) {
            return absl::InternalError("failure_code column missing from table");
        }

        std::map<std::string, int64_t> counts;
        int64_t total_failed = 0;
        for (size_t i = 0; i < rows.size(); ++i) {
            INSIGHTX_RETURN_IF_ERROR(CheckBudget(i));
            if (!table_.failed(rows[i])) {
                continue;
            }
            ++total_failed;
            const std::string& code = table_.value(*code_column, rows[i]);
            ++counts[code.empty() ? std::string(kUnknownFailureCode) : code];
        }

        // std::map iteration is lexical, so a stable sort keeps ties in code order
        std::vector<std::pair<std::string, int64_t>> ranked(counts.begin(), counts.end());
        std::stable_sort(ranked.begin(), ranked.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });

        size_t k = intent_.top_k.value_or(engine_.config_.default_top_k);
        k = std::clamp<size_t>(k, 1, engine_.config_.max_top_k);
        if (ranked.size() > k) {
            ranked.resize(k);
        }

        ComputedResult result;
        result.metric = "failure_codes";

        NumberDetail failed;
        failed.label = "Failed Transactions";
        failed.unit = Unit::kCount;
        failed.calculation.formula = "COUNT(status = 'Failed')";
        failed.calculation.sample_size = static_cast<int64_t>(rows.size());
        if (!rows.empty()) {
            failed.value = static_cast<double>(total_failed);
            failed.display = FormatCount(static_cast<double>(total_failed));
            failed.calculation.numerator = static_cast<double>(total_failed);
            failed.calculation.denominator = static_cast<double>(rows.size());
        } else {
            failed.display = kInsufficientData;
            failed.error_code = ErrorCode::kInsufficientData;
        }
        result.numbers.push_back(std::move(failed));

        ChartSeries chart;
        chart.type = ChartSeries::Type::kBar;
        chart.title = absl::StrCat("Top ", k, " Failure Codes");
        chart.x_label = "failure_code";
        chart.y_label = "Failed Transactions";

        for (const auto& [code, count] : ranked) {
            double share = RoundTo(100.0 * static_cast<double>(count) /
                                       static_cast<double>(total_failed),
                                   2);
            NumberDetail number;
            number.label = code;
            number.value = static_cast<double>(count);
            number.unit = Unit::kCount;
            number.display = absl::StrCat(FormatCount(static_cast<double>(count)), " (",
                                          FormatPercent(share, 2), " of failures)");
            number.calculation.formula =
                absl::StrCat("COUNT(failure_code = '", code, "') / COUNT(status = 'Failed')");
            number.calculation.numerator = static_cast<double>(count);
            number.calculation.denominator = static_cast<double>(total_failed);
            number.calculation.sample_size = total_failed;
            chart.points.push_back({code, static_cast<double>(count), ""});
            result.numbers.push_back(std::move(number));
        }
        result.series = std::move(chart);

        Finish(result,
               absl::StrCat("COUNT(*) WHERE status = 'Failed' GROUP BY failure_code "
                            "ORDER BY count DESC, failure_code ASC LIMIT ",
                            k),
               rows.size());
        return result;
    }

    absl::StatusOr<ComputedResult> RunExecutiveSummary() {
        INSIGHTX_ASSIGN_OR_RETURN(std::vector<uint32_t> rows, SelectBase());
        INSIGHTX_RETURN_IF_ERROR(RequireNonEmpty(rows));
        INSIGHTX_ASSIGN_OR_RETURN(Accumulator acc, Accumulate(rows));

        ComputedResult result;
        result.metric = "executive_summary";
        result.numbers.push_back(
            MetricNumber("Total Transactions", Metric::kCount, Reduction::kCount, acc));
        result.numbers.push_back(
            MetricNumber("Total Volume", Metric::kAmount, Reduction::kSum, acc));
        result.numbers.push_back(
            MetricNumber("Average Amount", Metric::kAmount, Reduction::kAvg, acc));
        result.numbers.push_back(
            MetricNumber("Failure Rate", Metric::kFailureRate, Reduction::kCount, acc));
        result.numbers.push_back(
            MetricNumber("Fraud Rate", Metric::kFraudRate, Reduction::kCount, acc));
        result.numbers.push_back(
            MetricNumber("Review Rate", Metric::kReviewRate, Reduction::kCount, acc));

        Finish(result,
               "COUNT(*), SUM(amount), AVG(amount), failure, fraud and review rates",
               rows.size());
        return result;
    }

    void Finish(ComputedResult& result, std::string formula, size_t matched) const {
        QueryTrace& trace = result.query_trace;
        trace.operation = std::string(OperationName(intent_.operation));
        trace.predicate = DescribeFilters(intent_.filters);
        trace.time_window = window_ ? window_->ToString() : std::string();
        trace.group_by = intent_.group_by;
        trace.formula = std::move(formula);
        trace.rows_scanned = static_cast<int64_t>(table_.size());
        trace.rows_matched = static_cast<int64_t>(matched);
        trace.elapsed_ms =
            std::chrono::duration<double, std::milli>(Clock::now() - started_).count();
    }

    const AnalysisEngine& engine_;
    const data::TransactionTable& table_;
    const Intent& intent_;
    std::optional<ResolvedWindow> window_;
    Clock::time_point started_;
    Clock::time_point deadline_;
};

// =============================================================================
// AnalysisEngine
// =============================================================================

AnalysisEngine::AnalysisEngine(std::shared_ptr<const data::TransactionTable> table,
                               AnalysisEngineConfig config)
    : table_(std::move(table)), config_(std::move(config)) {}

AnalysisEngine::~AnalysisEngine() = default;

ResolvedWindow AnalysisEngine::NormalizeTimeRange(const TimeRange& range) const {
    const data::TimeDomain& domain = table_->domain();
    absl::CivilDay domain_first = absl::ToCivilDay(domain.min, absl::UTCTimeZone());
    absl::CivilDay domain_last = absl::ToCivilDay(domain.max, absl::UTCTimeZone());

    ResolvedWindow window;
    window.first_day = domain_first;
    window.last_day = domain_last;
    window.explicit_range = true;

    if (range.period) {
        // Anchored at the latest transaction, not at the wall clock
        window.first_day = domain_last - (RelativePeriodDays(*range.period) - 1);
    } else {
        if (range.start) window.first_day = *range.start;
        if (range.end) window.last_day = *range.end;
    }
    window.first_day = std::max(window.first_day, domain_first);
    window.last_day = std::min(window.last_day, domain_last);
    return window;
}

absl::Status AnalysisEngine::Validate(const Intent& intent) const {
    if (intent.IsUnsupported() || !intent.unknown_terms.empty()) {
        return UnsupportedOperationError(intent.rejection_reason.empty()
                                             ? std::string("Question is outside the supported "
                                                           "metrics and operations")
                                             : intent.rejection_reason);
    }

    const data::DatasetSchema& schema = table_->schema();
    for (const auto& column : intent.group_by) {
        if (!schema.IsGroupable(column)) {
            return absl::InvalidArgumentError(absl::StrCat("Cannot group by ", column));
        }
    }
    if (intent.time_range && intent.time_range->start && intent.time_range->end &&
        *intent.time_range->end < *intent.time_range->start) {
        return absl::InvalidArgumentError(
            absl::StrCat("Time range ends before it starts: ", intent.time_range->ToString()));
    }

    switch (intent.operation) {
        case Operation::kAggregate:
        case Operation::kTimeSeries:
            if (!intent.metric) {
                return absl::InvalidArgumentError(
                    absl::StrCat(OperationName(intent.operation), " needs a metric"));
            }
            break;
        case Operation::kCompareSegments:
            if (!intent.segments || intent.segments->a.empty() || intent.segments->b.empty()) {
                return absl::InvalidArgumentError(
                    "compare_segments needs two non-empty segments");
            }
            if (!SegmentsDisjoint(intent.segments->a, intent.segments->b)) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Segments overlap: ", DescribeFilters(intent.segments->a),
                                 " vs ", DescribeFilters(intent.segments->b)));
            }
            break;
        default:
            break;
    }
    return absl::OkStatus();
}

absl::StatusOr<ComputedResult> AnalysisEngine::Resolve(const Intent& intent) const {
    INSIGHTX_RETURN_IF_ERROR(Validate(intent));

    Query query(*this, intent);
    auto result = query.Run();
    if (result.ok()) {
        INSIGHTX_LOG_DEBUG("Resolved {} over {} rows in {:.2f} ms",
                           result->query_trace.operation, result->query_trace.rows_matched,
                           result->query_trace.elapsed_ms);
    }
    return result;
}

}  // namespace insightx::analysis
