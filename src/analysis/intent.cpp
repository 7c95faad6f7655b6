/// @file intent.cpp
/// @brief Intent vocabulary and JSON conversion

#include "analysis/intent.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"

namespace insightx::analysis {

using json = nlohmann::json;

namespace {

bool Present(const json& object, const char* key) {
    return object.contains(key) && !object.at(key).is_null();
}

std::string FormatDay(absl::CivilDay day) {
    return absl::FormatCivilTime(day);
}

std::optional<absl::CivilDay> ParseDay(const std::string& text) {
    absl::CivilDay day;
    if (absl::ParseCivilTime(text, &day)) {
        return day;
    }
    return std::nullopt;
}

/// @brief Parse and canonicalise one filter; unknown terms are recorded
std::optional<FilterConstraint> ParseFilter(const json& item,
                                            const data::DatasetSchema& schema,
                                            std::vector<std::string>& unknown_terms) {
    std::string column = item.at("column").get<std::string>();
    const data::ColumnSpec* spec = schema.FindColumn(column);
    if (spec == nullptr || spec->kind == data::ColumnKind::kIdentifier ||
        spec->kind == data::ColumnKind::kTimestamp) {
        unknown_terms.push_back(absl::StrCat("column '", column, "'"));
        return std::nullopt;
    }

    std::string op = Present(item, "op")
                         ? absl::AsciiStrToLower(item.at("op").get<std::string>())
                         : std::string("eq");

    FilterConstraint filter;
    filter.column = spec->name;

    if (op == "range" || op == "between") {
        if (spec->kind != data::ColumnKind::kMeasure) {
            unknown_terms.push_back(absl::StrCat("range on '", spec->name, "'"));
            return std::nullopt;
        }
        filter.kind = FilterConstraint::Kind::kRange;
        if (Present(item, "min")) filter.min = item.at("min").get<double>();
        if (Present(item, "max")) filter.max = item.at("max").get<double>();
        if (!filter.min && !filter.max) {
            unknown_terms.push_back(absl::StrCat("unbounded range on '", spec->name, "'"));
            return std::nullopt;
        }
        if (filter.min && filter.max && *filter.min > *filter.max) {
            std::swap(filter.min, filter.max);
        }
        return filter;
    }

    if (op != "eq" && op != "equals" && op != "=" && op != "in") {
        unknown_terms.push_back(absl::StrCat("operator '", op, "'"));
        return std::nullopt;
    }
    if (spec->kind == data::ColumnKind::kMeasure) {
        unknown_terms.push_back(absl::StrCat("equality on '", spec->name, "'"));
        return std::nullopt;
    }

    std::vector<std::string> raw_values;
    if (Present(item, "values")) {
        raw_values = item.at("values").get<std::vector<std::string>>();
    } else if (Present(item, "value")) {
        raw_values.push_back(item.at("value").get<std::string>());
    }
    if (raw_values.empty()) {
        unknown_terms.push_back(absl::StrCat("empty filter on '", spec->name, "'"));
        return std::nullopt;
    }

    bool all_known = true;
    for (const auto& raw : raw_values) {
        auto canonical = schema.CanonicalValue(spec->name, raw);
        if (!canonical) {
            unknown_terms.push_back(absl::StrCat(spec->name, "='", raw, "'"));
            all_known = false;
            continue;
        }
        if (std::find(filter.values.begin(), filter.values.end(), *canonical) ==
            filter.values.end()) {
            filter.values.push_back(*canonical);
        }
    }
    if (!all_known) {
        return std::nullopt;
    }
    filter.kind = filter.values.size() == 1 ? FilterConstraint::Kind::kEquals
                                            : FilterConstraint::Kind::kIn;
    return filter;
}

FilterSet ParseFilterSet(const json& array,
                         const data::DatasetSchema& schema,
                         std::vector<std::string>& unknown_terms) {
    FilterSet filters;
    for (const auto& item : array) {
        auto filter = ParseFilter(item, schema, unknown_terms);
        if (filter) {
            filters.push_back(std::move(*filter));
        }
    }
    return filters;
}

json FilterSetToJson(const FilterSet& filters) {
    json array = json::array();
    for (const auto& filter : filters) {
        array.push_back(ToJson(filter));
    }
    return array;
}

}  // namespace

// =============================================================================
// Vocabulary
// =============================================================================

std::string_view OperationName(Operation op) {
    switch (op) {
        case Operation::kFailureRate: return "failure_rate";
        case Operation::kAggregate: return "aggregate";
        case Operation::kCompareSegments: return "compare_segments";
        case Operation::kTimeSeries: return "time_series";
        case Operation::kTopFailureCodes: return "top_failure_codes";
        case Operation::kExecutiveSummary: return "executive_summary";
        case Operation::kUnsupported: return "unsupported";
    }
    return "unsupported";
}

std::optional<Operation> ParseOperation(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    if (lower == "failure_rate") return Operation::kFailureRate;
    if (lower == "aggregate") return Operation::kAggregate;
    if (lower == "compare_segments") return Operation::kCompareSegments;
    if (lower == "time_series") return Operation::kTimeSeries;
    if (lower == "top_failure_codes") return Operation::kTopFailureCodes;
    if (lower == "executive_summary") return Operation::kExecutiveSummary;
    if (lower == "unsupported") return Operation::kUnsupported;
    return std::nullopt;
}

std::string_view ReductionName(Reduction reduction) {
    switch (reduction) {
        case Reduction::kSum: return "sum";
        case Reduction::kAvg: return "avg";
        case Reduction::kCount: return "count";
        case Reduction::kMin: return "min";
        case Reduction::kMax: return "max";
    }
    return "sum";
}

std::optional<Reduction> ParseReduction(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    if (lower == "sum" || lower == "total") return Reduction::kSum;
    if (lower == "avg" || lower == "average" || lower == "mean") return Reduction::kAvg;
    if (lower == "count") return Reduction::kCount;
    if (lower == "min") return Reduction::kMin;
    if (lower == "max") return Reduction::kMax;
    return std::nullopt;
}

const std::vector<Operation>& SupportedOperations() {
    static const std::vector<Operation> ops = {
        Operation::kFailureRate,     Operation::kAggregate,
        Operation::kCompareSegments, Operation::kTimeSeries,
        Operation::kTopFailureCodes, Operation::kExecutiveSummary,
    };
    return ops;
}

std::string_view RelativePeriodName(RelativePeriod period) {
    switch (period) {
        case RelativePeriod::kLast7Days: return "last_7_days";
        case RelativePeriod::kLast30Days: return "last_30_days";
        case RelativePeriod::kLast90Days: return "last_90_days";
    }
    return "last_30_days";
}

std::optional<RelativePeriod> ParseRelativePeriod(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    if (lower == "last_7_days") return RelativePeriod::kLast7Days;
    if (lower == "last_30_days") return RelativePeriod::kLast30Days;
    if (lower == "last_90_days") return RelativePeriod::kLast90Days;
    return std::nullopt;
}

int RelativePeriodDays(RelativePeriod period) {
    switch (period) {
        case RelativePeriod::kLast7Days: return 7;
        case RelativePeriod::kLast30Days: return 30;
        case RelativePeriod::kLast90Days: return 90;
    }
    return 30;
}

// =============================================================================
// Filters and time ranges
// =============================================================================

std::string FilterConstraint::ToString() const {
    switch (kind) {
        case Kind::kEquals:
            return absl::StrCat(column, " = '", values.empty() ? "" : values.front(), "'");
        case Kind::kIn:
            return absl::StrCat(column, " IN ('", absl::StrJoin(values, "', '"), "')");
        case Kind::kRange:
            if (min && max) {
                return absl::StrCat(column, " BETWEEN ", *min, " AND ", *max);
            }
            if (min) {
                return absl::StrCat(column, " >= ", *min);
            }
            return absl::StrCat(column, " <= ", max.value_or(0.0));
    }
    return column;
}

bool FilterConstraint::operator==(const FilterConstraint& other) const {
    return column == other.column && kind == other.kind && values == other.values &&
           min == other.min && max == other.max;
}

std::string DescribeFilters(const FilterSet& filters) {
    if (filters.empty()) {
        return "all transactions";
    }
    return absl::StrJoin(filters, " AND ",
                         [](std::string* out, const FilterConstraint& filter) {
                             out->append(filter.ToString());
                         });
}

std::string SegmentLabel(const FilterSet& filters) {
    if (filters.empty()) {
        return "All";
    }
    return absl::StrJoin(filters, ", ", [](std::string* out, const FilterConstraint& f) {
        if (f.kind == FilterConstraint::Kind::kRange) {
            out->append(f.ToString());
        } else {
            out->append(absl::StrJoin(f.values, "/"));
        }
    });
}

std::string TimeRange::ToString() const {
    if (period) {
        return absl::StrCat("last ", RelativePeriodDays(*period), " days");
    }
    if (start && end) {
        return absl::StrCat(FormatDay(*start), " to ", FormatDay(*end));
    }
    if (start) {
        return absl::StrCat("from ", FormatDay(*start));
    }
    if (end) {
        return absl::StrCat("until ", FormatDay(*end));
    }
    return "all time";
}

bool TimeRange::operator==(const TimeRange& other) const {
    return start == other.start && end == other.end && period == other.period;
}

bool Intent::operator==(const Intent& other) const {
    return operation == other.operation && metric == other.metric &&
           reduction == other.reduction && filters == other.filters &&
           group_by == other.group_by && time_range == other.time_range &&
           segments == other.segments && top_k == other.top_k &&
           confidence == other.confidence &&
           inherits_context == other.inherits_context &&
           unknown_terms == other.unknown_terms &&
           rejection_reason == other.rejection_reason;
}

// =============================================================================
// JSON
// =============================================================================

json ToJson(const FilterConstraint& filter) {
    json j;
    j["column"] = filter.column;
    switch (filter.kind) {
        case FilterConstraint::Kind::kEquals: j["op"] = "eq"; break;
        case FilterConstraint::Kind::kIn: j["op"] = "in"; break;
        case FilterConstraint::Kind::kRange: j["op"] = "range"; break;
    }
    j["values"] = filter.values;
    j["min"] = filter.min ? json(*filter.min) : json(nullptr);
    j["max"] = filter.max ? json(*filter.max) : json(nullptr);
    return j;
}

json ToJson(const Intent& intent) {
    json j;
    j["operation"] = std::string(OperationName(intent.operation));
    j["metric"] = intent.metric ? json(std::string(data::MetricName(*intent.metric)))
                                : json(nullptr);
    j["reduction"] = intent.reduction
                         ? json(std::string(ReductionName(*intent.reduction)))
                         : json(nullptr);
    j["filters"] = FilterSetToJson(intent.filters);
    j["group_by"] = intent.group_by;

    if (intent.time_range) {
        const TimeRange& range = *intent.time_range;
        j["time_range"] = {
            {"start", range.start ? json(FormatDay(*range.start)) : json(nullptr)},
            {"end", range.end ? json(FormatDay(*range.end)) : json(nullptr)},
            {"period", range.period ? json(std::string(RelativePeriodName(*range.period)))
                                    : json(nullptr)},
        };
    } else {
        j["time_range"] = nullptr;
    }

    if (intent.segments) {
        j["segments"] = {
            {"a", FilterSetToJson(intent.segments->a)},
            {"b", FilterSetToJson(intent.segments->b)},
        };
    } else {
        j["segments"] = nullptr;
    }

    j["top_k"] = intent.top_k ? json(*intent.top_k) : json(nullptr);
    j["confidence"] = intent.confidence;
    j["inherits_context"] = intent.inherits_context;
    j["unknown_terms"] = intent.unknown_terms;
    j["rejection_reason"] = intent.rejection_reason;
    return j;
}

absl::StatusOr<Intent> IntentFromJson(const json& j, const data::DatasetSchema& schema) {
    if (!j.is_object()) {
        return MakeError(ErrorCode::kDeserializationError, "Intent must be a JSON object");
    }

    Intent intent;
    std::vector<std::string> unknown;

    try {
        std::string op_name = Present(j, "operation")
                                  ? j.at("operation").get<std::string>()
                                  : std::string("unsupported");
        auto op = ParseOperation(op_name);
        if (!op) {
            unknown.push_back(absl::StrCat("operation '", op_name, "'"));
            intent.operation = Operation::kUnsupported;
        } else {
            intent.operation = *op;
        }

        if (Present(j, "metric")) {
            std::string metric_name = j.at("metric").get<std::string>();
            auto metric = data::ParseMetric(metric_name);
            if (metric) {
                intent.metric = *metric;
            } else {
                unknown.push_back(absl::StrCat("metric '", metric_name, "'"));
            }
        }

        if (Present(j, "reduction")) {
            std::string reduction_name = j.at("reduction").get<std::string>();
            auto reduction = ParseReduction(reduction_name);
            if (reduction) {
                intent.reduction = *reduction;
            } else {
                unknown.push_back(absl::StrCat("reduction '", reduction_name, "'"));
            }
        }

        if (Present(j, "filters")) {
            intent.filters = ParseFilterSet(j.at("filters"), schema, unknown);
        }

        if (Present(j, "group_by")) {
            for (const auto& column : j.at("group_by").get<std::vector<std::string>>()) {
                const data::ColumnSpec* spec = schema.FindColumn(column);
                if (spec == nullptr || !schema.IsGroupable(spec->name)) {
                    unknown.push_back(absl::StrCat("column '", column, "'"));
                    continue;
                }
                if (std::find(intent.group_by.begin(), intent.group_by.end(), spec->name) ==
                    intent.group_by.end()) {
                    intent.group_by.push_back(spec->name);
                }
            }
        }

        if (Present(j, "time_range")) {
            const json& tr = j.at("time_range");
            TimeRange range;
            if (Present(tr, "period")) {
                std::string period_name = tr.at("period").get<std::string>();
                range.period = ParseRelativePeriod(period_name);
                if (!range.period) {
                    unknown.push_back(absl::StrCat("period '", period_name, "'"));
                }
            }
            if (!range.period) {
                for (const char* key : {"start", "end"}) {
                    if (!Present(tr, key)) continue;
                    std::string text = tr.at(key).get<std::string>();
                    auto day = ParseDay(text);
                    if (!day) {
                        unknown.push_back(absl::StrCat("date '", text, "'"));
                        continue;
                    }
                    (std::string_view(key) == "start" ? range.start : range.end) = *day;
                }
            }
            if (range.period || range.start || range.end) {
                intent.time_range = range;
            }
        }

        if (Present(j, "segments")) {
            const json& seg = j.at("segments");
            SegmentPair pair;
            if (Present(seg, "a")) pair.a = ParseFilterSet(seg.at("a"), schema, unknown);
            if (Present(seg, "b")) pair.b = ParseFilterSet(seg.at("b"), schema, unknown);
            intent.segments = std::move(pair);
        }

        if (Present(j, "top_k")) {
            int64_t top_k = j.at("top_k").get<int64_t>();
            if (top_k > 0) {
                intent.top_k = static_cast<size_t>(top_k);
            }
        }

        if (Present(j, "confidence")) {
            intent.confidence = std::clamp(j.at("confidence").get<double>(), 0.0, 1.0);
        }
        if (Present(j, "inherits_context")) {
            intent.inherits_context = j.at("inherits_context").get<bool>();
        }
        if (Present(j, "rejection_reason")) {
            intent.rejection_reason = j.at("rejection_reason").get<std::string>();
        }

        if (Present(j, "unknown_terms")) {
            for (auto& term : j.at("unknown_terms").get<std::vector<std::string>>()) {
                if (!term.empty()) {
                    unknown.push_back(std::move(term));
                }
            }
        }
    } catch (const json::exception& e) {
        return MakeError(ErrorCode::kDeserializationError,
                         absl::StrCat("Malformed intent: ", e.what()));
    }

    // De-duplicate while keeping first-seen order
    for (auto& term : unknown) {
        if (std::find(intent.unknown_terms.begin(), intent.unknown_terms.end(), term) ==
            intent.unknown_terms.end()) {
            intent.unknown_terms.push_back(std::move(term));
        }
    }
    if (!intent.unknown_terms.empty()) {
        intent.operation = Operation::kUnsupported;
        if (intent.rejection_reason.empty()) {
            intent.rejection_reason = absl::StrCat(
                "Not in the dataset vocabulary: ", absl::StrJoin(intent.unknown_terms, ", "));
        }
    }
    return intent;
}

}  // namespace insightx::analysis
