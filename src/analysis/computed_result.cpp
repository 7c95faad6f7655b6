/// @file computed_result.cpp
/// @brief ComputedResult serialisation

#include "analysis/computed_result.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace insightx::analysis {

using json = nlohmann::json;

std::string_view UnitName(Unit unit) {
    switch (unit) {
        case Unit::kCount: return "count";
        case Unit::kCurrency: return "INR";
        case Unit::kPercent: return "percent";
        case Unit::kPercentagePoints: return "percentage_points";
    }
    return "count";
}

std::string QueryTrace::ToString() const {
    std::string out = absl::StrCat(operation, " WHERE ", predicate);
    if (!time_window.empty()) {
        absl::StrAppend(&out, " [", time_window, "]");
    }
    if (!group_by.empty()) {
        absl::StrAppend(&out, " GROUP BY ", absl::StrJoin(group_by, ", "));
    }
    if (!granularity.empty()) {
        absl::StrAppend(&out, " BUCKET BY ", granularity);
    }
    absl::StrAppend(&out, " -> ", formula);
    return out;
}

std::string ComputedResult::Summary() const {
    std::vector<std::string> parts;
    for (const auto& number : numbers) {
        if (parts.size() == 3) {
            break;
        }
        parts.push_back(absl::StrCat(number.label, ": ", number.display));
    }
    return absl::StrJoin(parts, "; ");
}

json ToJson(const NumberDetail& number) {
    json calc;
    calc["formula"] = number.calculation.formula;
    calc["numerator"] = number.calculation.numerator ? json(*number.calculation.numerator)
                                                     : json(nullptr);
    calc["denominator"] = number.calculation.denominator
                              ? json(*number.calculation.denominator)
                              : json(nullptr);
    calc["sample_size"] = number.calculation.sample_size;

    json j;
    j["label"] = number.label;
    j["value"] = number.value ? json(*number.value) : json(nullptr);
    j["unit"] = std::string(UnitName(number.unit));
    j["display"] = number.display;
    j["available"] = number.available();
    j["error_code"] = number.error_code ? json(std::string(ErrorCodeName(*number.error_code)))
                                        : json(nullptr);
    j["calculation"] = std::move(calc);
    return j;
}

json ToJson(const ChartSeries& series) {
    json points = json::array();
    for (const auto& point : series.points) {
        json p = {{"x", point.x}, {"y", point.y}};
        if (!point.group.empty()) {
            p["group"] = point.group;
        }
        points.push_back(std::move(p));
    }
    return {
        {"type", series.type == ChartSeries::Type::kLine ? "line" : "bar"},
        {"title", series.title},
        {"x_label", series.x_label},
        {"y_label", series.y_label},
        {"data", std::move(points)},
    };
}

json ToJson(const QueryTrace& trace) {
    return {
        {"operation", trace.operation},
        {"predicate", trace.predicate},
        {"time_window", trace.time_window},
        {"group_by", trace.group_by},
        {"granularity", trace.granularity},
        {"formula", trace.formula},
        {"rows_scanned", trace.rows_scanned},
        {"rows_matched", trace.rows_matched},
        {"elapsed_ms", trace.elapsed_ms},
    };
}

json ToJson(const ComputedResult& result) {
    json numbers = json::array();
    for (const auto& number : result.numbers) {
        numbers.push_back(ToJson(number));
    }
    json j;
    j["metric"] = result.metric;
    j["numbers"] = std::move(numbers);
    j["chart"] = result.series ? ToJson(*result.series) : json(nullptr);
    j["query_trace"] = ToJson(result.query_trace);
    return j;
}

}  // namespace insightx::analysis
