/// @file transaction_table.cpp
/// @brief Transaction table construction and CSV ingestion

#include "data/transaction_table.h"

#include <cmath>
#include <fstream>
#include <algorithm>
#include <unordered_map>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>

#include "common/error.h"
#include "common/logging.h"

namespace insightx::data {

namespace {

/// Rows rejected beyond this count are summarised instead of logged one by one
constexpr size_t kMaxLoggedRejections = 5;

constexpr const char* kTimestampFormats[] = {
    "%Y-%m-%dT%H:%M:%E*S",
    "%Y-%m-%d %H:%M:%E*S",
    "%Y-%m-%dT%H:%M",
    "%Y-%m-%d %H:%M",
    "%Y-%m-%d",
};

const std::string& CategoricalField(const TransactionRecord& record,
                                    const std::string& column,
                                    std::string& scratch) {
    if (column == "payment_method") return record.payment_method;
    if (column == "device") return record.device;
    if (column == "state") return record.state;
    if (column == "age_group") return record.age_group;
    if (column == "network") return record.network;
    if (column == "category") return record.category;
    if (column == "status") return record.status;
    if (column == "failure_code") return record.failure_code;
    if (column == "fraud_flag") {
        scratch = record.fraud_flag ? "1" : "0";
        return scratch;
    }
    if (column == "review_flag") {
        scratch = record.review_flag ? "1" : "0";
        return scratch;
    }
    scratch.clear();
    return scratch;
}

/// @brief Split one CSV line, honouring double-quoted fields
std::vector<std::string> SplitCsvLine(std::string_view line) {
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    current.push_back('"');
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                current.push_back(c);
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

}  // namespace

std::optional<absl::Time> ParseTimestamp(std::string_view text) {
    std::string trimmed(absl::StripAsciiWhitespace(text));
    if (trimmed.empty()) {
        return std::nullopt;
    }
    for (const char* format : kTimestampFormats) {
        absl::Time parsed;
        std::string err;
        if (absl::ParseTime(format, trimmed, absl::UTCTimeZone(), &parsed, &err)) {
            return parsed;
        }
    }
    return std::nullopt;
}

// =============================================================================
// TransactionTable
// =============================================================================

TransactionTable::TransactionTable(const DatasetSchema& schema) : schema_(&schema) {
    for (const auto& column : schema.columns()) {
        if (column.kind == ColumnKind::kDimension || column.kind == ColumnKind::kFlag) {
            categoricals_.push_back(CategoricalColumn{column.name, {}, {}});
        }
    }
}

std::optional<size_t> TransactionTable::CategoricalIndex(std::string_view column) const {
    for (size_t i = 0; i < categoricals_.size(); ++i) {
        if (absl::EqualsIgnoreCase(categoricals_[i].name, column)) {
            return i;
        }
    }
    return std::nullopt;
}

std::optional<uint16_t> TransactionTable::CodeOf(size_t column,
                                                 std::string_view value) const {
    const auto& dictionary = categoricals_[column].dictionary;
    for (size_t i = 0; i < dictionary.size(); ++i) {
        if (dictionary[i] == value) {
            return static_cast<uint16_t>(i);
        }
    }
    return std::nullopt;
}

uint16_t TransactionTable::Encode(CategoricalColumn& column, const std::string& value) {
    for (size_t i = 0; i < column.dictionary.size(); ++i) {
        if (column.dictionary[i] == value) {
            return static_cast<uint16_t>(i);
        }
    }
    column.dictionary.push_back(value);
    return static_cast<uint16_t>(column.dictionary.size() - 1);
}

absl::Status TransactionTable::AppendValidated(const TransactionRecord& record) {
    if (!std::isfinite(record.amount) || record.amount < 0.0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid amount ", record.amount, " for transaction '",
                         record.transaction_id, "'"));
    }
    if (record.timestamp == absl::InfinitePast() ||
        record.timestamp == absl::InfiniteFuture()) {
        return absl::InvalidArgumentError(
            absl::StrCat("Missing timestamp for transaction '", record.transaction_id, "'"));
    }

    // Validate every categorical value before mutating any column
    std::vector<std::string> canonical;
    canonical.reserve(categoricals_.size());
    std::string scratch;
    for (const auto& column : categoricals_) {
        const std::string& raw = CategoricalField(record, column.name, scratch);
        auto value = schema_->CanonicalValue(column.name, raw);
        if (!value) {
            return absl::InvalidArgumentError(
                absl::StrCat("Unknown value '", raw, "' for column '", column.name, "'"));
        }
        canonical.push_back(std::move(*value));
    }

    bool is_failed = false;
    for (size_t i = 0; i < categoricals_.size(); ++i) {
        categoricals_[i].codes.push_back(Encode(categoricals_[i], canonical[i]));
        if (categoricals_[i].name == "status") {
            is_failed = canonical[i] == "Failed";
        }
    }

    ids_.push_back(record.transaction_id);
    timestamps_.push_back(record.timestamp);
    amounts_.push_back(record.amount);
    failed_.push_back(is_failed ? 1 : 0);
    fraud_.push_back(record.fraud_flag ? 1 : 0);
    review_.push_back(record.review_flag ? 1 : 0);

    if (timestamps_.size() == 1) {
        domain_.min = record.timestamp;
        domain_.max = record.timestamp;
    } else {
        domain_.min = std::min(domain_.min, record.timestamp);
        domain_.max = std::max(domain_.max, record.timestamp);
    }
    return absl::OkStatus();
}

// =============================================================================
// Builder
// =============================================================================

TransactionTable::Builder::Builder(const DatasetSchema& schema)
    : table_(new TransactionTable(schema)) {}

TransactionTable::Builder::~Builder() = default;

absl::Status TransactionTable::Builder::Append(const TransactionRecord& record) {
    return table_->AppendValidated(record);
}

size_t TransactionTable::Builder::size() const {
    return table_->size();
}

std::shared_ptr<const TransactionTable> TransactionTable::Builder::Build() {
    const DatasetSchema& schema = *table_->schema_;
    std::shared_ptr<const TransactionTable> built(table_.release());
    table_.reset(new TransactionTable(schema));
    return built;
}

// =============================================================================
// CSV ingestion
// =============================================================================

absl::StatusOr<std::shared_ptr<const TransactionTable>> TransactionTable::LoadCsv(
    const std::filesystem::path& path,
    const DatasetSchema& schema,
    LoadSummary* summary) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return absl::NotFoundError(
            absl::StrCat("Dataset file not found: ", path.string()));
    }
    return ParseCsv(file, schema, summary);
}

absl::StatusOr<std::shared_ptr<const TransactionTable>> TransactionTable::ParseCsv(
    std::istream& input,
    const DatasetSchema& schema,
    LoadSummary* summary) {
    std::string line;
    if (!std::getline(input, line)) {
        return absl::InvalidArgumentError("Dataset is empty: missing header row");
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }

    std::vector<std::string> header = SplitCsvLine(line);
    std::unordered_map<std::string, size_t> positions;
    for (size_t i = 0; i < header.size(); ++i) {
        positions[absl::AsciiStrToLower(absl::StripAsciiWhitespace(header[i]))] = i;
    }

    std::vector<std::string> missing;
    for (const auto& column : schema.columns()) {
        if (positions.find(column.name) == positions.end()) {
            missing.push_back(column.name);
        }
    }
    if (!missing.empty()) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("Dataset is missing required columns: ",
                                      absl::StrJoin(missing, ", ")));
    }

    auto field = [&positions](const std::vector<std::string>& fields,
                              const char* column) -> const std::string& {
        return fields[positions.at(column)];
    };

    Builder builder(schema);
    size_t rejected = 0;
    size_t line_number = 1;

    auto reject = [&rejected, &line_number](std::string_view reason) {
        ++rejected;
        if (rejected <= kMaxLoggedRejections) {
            INSIGHTX_LOG_WARN("Skipping dataset line {}: {}", line_number, reason);
        }
    };

    while (std::getline(input, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (absl::StripAsciiWhitespace(line).empty()) {
            continue;
        }

        std::vector<std::string> fields = SplitCsvLine(line);
        if (fields.size() != header.size()) {
            reject(absl::StrCat("expected ", header.size(), " fields, got ", fields.size()));
            continue;
        }

        TransactionRecord record;
        record.transaction_id = field(fields, "transaction_id");

        auto timestamp = ParseTimestamp(field(fields, "timestamp"));
        if (!timestamp) {
            reject(absl::StrCat("unparseable timestamp '", field(fields, "timestamp"), "'"));
            continue;
        }
        record.timestamp = *timestamp;

        if (!absl::SimpleAtod(absl::StripAsciiWhitespace(field(fields, "amount")),
                              &record.amount)) {
            reject(absl::StrCat("unparseable amount '", field(fields, "amount"), "'"));
            continue;
        }

        record.payment_method = field(fields, "payment_method");
        record.device = field(fields, "device");
        record.state = field(fields, "state");
        record.age_group = field(fields, "age_group");
        record.network = field(fields, "network");
        record.category = field(fields, "category");
        record.status = field(fields, "status");
        record.failure_code = field(fields, "failure_code");

        auto fraud = schema.CanonicalValue("fraud_flag", field(fields, "fraud_flag"));
        auto review = schema.CanonicalValue("review_flag", field(fields, "review_flag"));
        if (!fraud || !review) {
            reject("invalid fraud_flag/review_flag");
            continue;
        }
        record.fraud_flag = *fraud == "1";
        record.review_flag = *review == "1";

        auto status = builder.Append(record);
        if (!status.ok()) {
            reject(status.message());
        }
    }

    if (rejected > kMaxLoggedRejections) {
        INSIGHTX_LOG_WARN("{} dataset lines skipped in total", rejected);
    }

    std::shared_ptr<const TransactionTable> table = builder.Build();
    if (table->empty()) {
        return MakeError(ErrorCode::kInvalidArgument,
                         absl::StrCat("Dataset contains no valid rows (", rejected,
                                      " rejected)"));
    }

    if (summary != nullptr) {
        summary->rows_loaded = table->size();
        summary->rows_rejected = rejected;
        summary->domain = table->domain();
    }
    INSIGHTX_LOG_INFO("Loaded {} transactions ({} rejected), {} .. {}",
                      table->size(), rejected,
                      absl::FormatTime("%Y-%m-%d", table->domain().min, absl::UTCTimeZone()),
                      absl::FormatTime("%Y-%m-%d", table->domain().max, absl::UTCTimeZone()));
    return table;
}

}  // namespace insightx::data
