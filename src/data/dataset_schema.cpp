/// @file dataset_schema.cpp
/// @brief Payment dataset schema definition

#include "data/dataset_schema.h"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

namespace insightx::data {

namespace {

std::vector<ColumnSpec> BuildPaymentColumns() {
    std::vector<ColumnSpec> columns;

    columns.push_back({"transaction_id", ColumnKind::kIdentifier,
                       "Unique transaction identifier", {}, false});
    columns.push_back({"timestamp", ColumnKind::kTimestamp,
                       "Time the transaction was attempted (UTC)", {}, false});
    columns.push_back({"amount", ColumnKind::kMeasure,
                       "Transaction amount in INR", {}, false});

    columns.push_back({"payment_method", ColumnKind::kDimension,
                       "Payment instrument",
                       {"UPI", "Card", "NetBanking"}, false});
    columns.push_back({"device", ColumnKind::kDimension,
                       "Device platform",
                       {"Android", "iOS", "Web"}, false});
    columns.push_back({"state", ColumnKind::kDimension,
                       "Indian state of the payer",
                       {"Maharashtra", "Uttar Pradesh", "Karnataka", "Tamil Nadu",
                        "Gujarat", "Rajasthan", "West Bengal", "Andhra Pradesh",
                        "Madhya Pradesh", "Kerala", "Telangana", "Bihar", "Delhi",
                        "Punjab", "Haryana", "Odisha", "Jharkhand", "Assam",
                        "Chhattisgarh"},
                       false});
    columns.push_back({"age_group", ColumnKind::kDimension,
                       "Payer age bracket",
                       {"<25", "25-34", "35-44", "45+"}, false});
    columns.push_back({"network", ColumnKind::kDimension,
                       "Network type at payment time",
                       {"4G", "5G", "WiFi", "3G"}, false});
    columns.push_back({"category", ColumnKind::kDimension,
                       "Merchant category",
                       {"Food", "Entertainment", "Travel", "Utilities", "Others"},
                       false});
    columns.push_back({"status", ColumnKind::kDimension,
                       "Transaction outcome",
                       {"Success", "Failed"}, false});
    columns.push_back({"failure_code", ColumnKind::kDimension,
                       "Reason for failure, empty on success",
                       {"TIMEOUT", "INSUFFICIENT_BALANCE", "BANK_DECLINED",
                        "INVALID_OTP", "NETWORK_ERROR", "LIMIT_EXCEEDED",
                        "CARD_EXPIRED", "FRAUD_SUSPECTED", "TECHNICAL_ERROR",
                        "USER_CANCELLED"},
                       true});

    columns.push_back({"fraud_flag", ColumnKind::kFlag,
                       "1 if the transaction was flagged as fraud", {"0", "1"}, false});
    columns.push_back({"review_flag", ColumnKind::kFlag,
                       "1 if the transaction was sent for manual review", {"0", "1"},
                       false});
    return columns;
}

std::vector<MetricSpec> BuildPaymentMetrics() {
    return {
        {Metric::kAmount, "amount", "Amount",
         "Transaction amount in INR; reduce with sum, avg, count, min or max"},
        {Metric::kCount, "count", "Transaction Count",
         "Number of transactions"},
        {Metric::kFailureRate, "failure_rate", "Failure Rate",
         "Failed transactions as a percentage of all transactions"},
        {Metric::kFraudRate, "fraud_rate", "Fraud Rate",
         "Fraud-flagged transactions as a percentage of all transactions"},
        {Metric::kReviewRate, "review_rate", "Review Rate",
         "Review-flagged transactions as a percentage of all transactions"},
    };
}

}  // namespace

std::string_view MetricName(Metric metric) {
    switch (metric) {
        case Metric::kAmount: return "amount";
        case Metric::kCount: return "count";
        case Metric::kFailureRate: return "failure_rate";
        case Metric::kFraudRate: return "fraud_rate";
        case Metric::kReviewRate: return "review_rate";
    }
    return "count";
}

std::string_view MetricLabel(Metric metric) {
    switch (metric) {
        case Metric::kAmount: return "Amount";
        case Metric::kCount: return "Transaction Count";
        case Metric::kFailureRate: return "Failure Rate";
        case Metric::kFraudRate: return "Fraud Rate";
        case Metric::kReviewRate: return "Review Rate";
    }
    return "Transaction Count";
}

std::optional<Metric> ParseMetric(std::string_view name) {
    std::string lower = absl::AsciiStrToLower(name);
    if (lower == "amount") return Metric::kAmount;
    if (lower == "count" || lower == "volume") return Metric::kCount;
    if (lower == "failure_rate") return Metric::kFailureRate;
    if (lower == "fraud_rate") return Metric::kFraudRate;
    if (lower == "review_rate") return Metric::kReviewRate;
    return std::nullopt;
}

bool IsRateMetric(Metric metric) {
    return metric == Metric::kFailureRate || metric == Metric::kFraudRate ||
           metric == Metric::kReviewRate;
}

const DatasetSchema& DatasetSchema::Default() {
    static const DatasetSchema schema(1, "transactions", BuildPaymentColumns(),
                                      BuildPaymentMetrics());
    return schema;
}

DatasetSchema::DatasetSchema(int version, std::string table_name,
                             std::vector<ColumnSpec> columns,
                             std::vector<MetricSpec> metrics)
    : version_(version),
      table_name_(std::move(table_name)),
      columns_(std::move(columns)),
      metrics_(std::move(metrics)) {}

const ColumnSpec* DatasetSchema::FindColumn(std::string_view name) const {
    for (const auto& column : columns_) {
        if (absl::EqualsIgnoreCase(column.name, name)) {
            return &column;
        }
    }
    return nullptr;
}

const MetricSpec* DatasetSchema::FindMetric(Metric metric) const {
    for (const auto& spec : metrics_) {
        if (spec.metric == metric) {
            return &spec;
        }
    }
    return nullptr;
}

bool DatasetSchema::IsGroupable(std::string_view column) const {
    const ColumnSpec* spec = FindColumn(column);
    return spec != nullptr &&
           (spec->kind == ColumnKind::kDimension || spec->kind == ColumnKind::kFlag);
}

std::vector<std::string> DatasetSchema::DimensionNames() const {
    std::vector<std::string> names;
    for (const auto& column : columns_) {
        if (column.kind == ColumnKind::kDimension) {
            names.push_back(column.name);
        }
    }
    return names;
}

std::optional<std::string> DatasetSchema::CanonicalValue(std::string_view column,
                                                         std::string_view value) const {
    const ColumnSpec* spec = FindColumn(column);
    if (spec == nullptr) {
        return std::nullopt;
    }
    std::string_view trimmed = absl::StripAsciiWhitespace(value);

    if (spec->kind == ColumnKind::kFlag) {
        std::string lower = absl::AsciiStrToLower(trimmed);
        if (lower == "1" || lower == "true" || lower == "yes") return std::string("1");
        if (lower == "0" || lower == "false" || lower == "no") return std::string("0");
        return std::nullopt;
    }
    if (spec->kind != ColumnKind::kDimension) {
        return std::nullopt;
    }
    if (trimmed.empty()) {
        return spec->allows_empty ? std::optional<std::string>(std::string())
                                  : std::nullopt;
    }
    for (const auto& permitted : spec->permitted_values) {
        if (absl::EqualsIgnoreCase(permitted, trimmed)) {
            return permitted;
        }
    }
    return std::nullopt;
}

std::string DatasetSchema::Describe() const {
    std::string out = absl::StrCat("Table `", table_name_, "` (schema version ",
                                   version_, "), one row per payment transaction.\n");
    absl::StrAppend(&out, "Columns:\n");
    for (const auto& column : columns_) {
        absl::StrAppend(&out, "- ", column.name, ": ", column.description);
        if (!column.permitted_values.empty()) {
            absl::StrAppend(&out, " [", absl::StrJoin(column.permitted_values, ", "), "]");
        }
        absl::StrAppend(&out, "\n");
    }
    absl::StrAppend(&out, "Metrics:\n");
    for (const auto& metric : metrics_) {
        absl::StrAppend(&out, "- ", metric.name, ": ", metric.description, "\n");
    }
    return out;
}

}  // namespace insightx::data
