#pragma once

/// @file transaction_table.h
/// @brief Immutable, dictionary-encoded columnar table of payment transactions

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include "data/dataset_schema.h"

namespace insightx::data {

/// @brief One transaction as it appears in the source file
struct TransactionRecord {
    std::string transaction_id;
    absl::Time timestamp = absl::UnixEpoch();
    double amount = 0.0;
    std::string payment_method;
    std::string device;
    std::string state;
    std::string age_group;
    std::string network;
    std::string category;
    std::string status;
    std::string failure_code;
    bool fraud_flag = false;
    bool review_flag = false;
};

/// @brief Inclusive [min, max] timestamp range of the loaded rows
struct TimeDomain {
    absl::Time min = absl::InfinitePast();
    absl::Time max = absl::InfinitePast();
};

/// @brief Result of a CSV load
struct LoadSummary {
    size_t rows_loaded = 0;
    size_t rows_rejected = 0;
    TimeDomain domain;
};

/// @brief Parse a timestamp in one of the accepted ISO-8601 forms (UTC)
std::optional<absl::Time> ParseTimestamp(std::string_view text);

/// @brief Read-only transaction table
///
/// Categorical columns (dimensions and flags) are dictionary encoded: each
/// row stores a small code, each column stores its distinct values. The
/// table is built once and shared between requests as
/// `std::shared_ptr<const TransactionTable>`.
class TransactionTable {
public:
    /// @brief Incremental construction with per-record schema validation
    class Builder {
    public:
        explicit Builder(const DatasetSchema& schema = DatasetSchema::Default());
        ~Builder();

        /// @brief Validate and append a record
        /// @return kInvalidArgument naming the offending column on failure
        absl::Status Append(const TransactionRecord& record);

        size_t size() const;

        /// @brief Finish the table; the builder is empty afterwards
        std::shared_ptr<const TransactionTable> Build();

    private:
        std::unique_ptr<TransactionTable> table_;
    };

    /// @brief Load a CSV file with a header row
    ///
    /// Missing required columns fail the load. Individual rows that do not
    /// conform to the schema are skipped and counted in the summary.
    static absl::StatusOr<std::shared_ptr<const TransactionTable>> LoadCsv(
        const std::filesystem::path& path,
        const DatasetSchema& schema = DatasetSchema::Default(),
        LoadSummary* summary = nullptr);

    /// @brief Parse CSV from a stream (see LoadCsv)
    static absl::StatusOr<std::shared_ptr<const TransactionTable>> ParseCsv(
        std::istream& input,
        const DatasetSchema& schema = DatasetSchema::Default(),
        LoadSummary* summary = nullptr);

    size_t size() const { return timestamps_.size(); }
    bool empty() const { return timestamps_.empty(); }
    const DatasetSchema& schema() const { return *schema_; }
    const TimeDomain& domain() const { return domain_; }

    // =========================================================================
    // Column access
    // =========================================================================

    absl::Time timestamp(size_t row) const { return timestamps_[row]; }
    double amount(size_t row) const { return amounts_[row]; }
    bool failed(size_t row) const { return failed_[row] != 0; }
    bool fraud(size_t row) const { return fraud_[row] != 0; }
    bool review(size_t row) const { return review_[row] != 0; }
    const std::string& transaction_id(size_t row) const { return ids_[row]; }

    /// @brief Index of a categorical column, usable with code()/value()
    std::optional<size_t> CategoricalIndex(std::string_view column) const;

    uint16_t code(size_t column, size_t row) const {
        return categoricals_[column].codes[row];
    }
    const std::string& value(size_t column, size_t row) const {
        const auto& col = categoricals_[column];
        return col.dictionary[col.codes[row]];
    }

    const std::string& Decode(size_t column, uint16_t code) const {
        return categoricals_[column].dictionary[code];
    }

    /// @brief Code of a canonical value, nullopt if no row carries it
    std::optional<uint16_t> CodeOf(size_t column, std::string_view value) const;

    /// @brief Number of distinct values seen in a categorical column
    size_t Cardinality(size_t column) const {
        return categoricals_[column].dictionary.size();
    }

private:
    struct CategoricalColumn {
        std::string name;
        std::vector<std::string> dictionary;
        std::vector<uint16_t> codes;
    };

    explicit TransactionTable(const DatasetSchema& schema);

    absl::Status AppendValidated(const TransactionRecord& record);
    uint16_t Encode(CategoricalColumn& column, const std::string& value);

    const DatasetSchema* schema_;

    std::vector<std::string> ids_;
    std::vector<absl::Time> timestamps_;
    std::vector<double> amounts_;
    std::vector<uint8_t> failed_;
    std::vector<uint8_t> fraud_;
    std::vector<uint8_t> review_;
    std::vector<CategoricalColumn> categoricals_;

    TimeDomain domain_;
};

}  // namespace insightx::data
