/// @file transaction_table_test.cpp
/// @brief Tests for the columnar transaction table and CSV ingestion

#include <gtest/gtest.h>

#include <sstream>

#include "common/error.h"
#include "data/transaction_table.h"
#include "support/fakes.h"

namespace insightx::data {
namespace {

constexpr const char* kHeader =
    "transaction_id,timestamp,amount,payment_method,device,state,age_group,network,"
    "category,status,failure_code,fraud_flag,review_flag\n";

TEST(ParseTimestampTest, AcceptedForms) {
    absl::Time expected = test::At(2024, 3, 5, 14) + absl::Minutes(30);

    EXPECT_EQ(ParseTimestamp("2024-03-05T14:30:00"), expected);
    EXPECT_EQ(ParseTimestamp("2024-03-05 14:30:00"), expected);
    EXPECT_EQ(ParseTimestamp("2024-03-05 14:30"), expected);
    EXPECT_EQ(ParseTimestamp("2024-03-05"), test::At(2024, 3, 5, 0));
    EXPECT_FALSE(ParseTimestamp("05/03/2024").has_value());
    EXPECT_FALSE(ParseTimestamp("").has_value());
}

TEST(TransactionTableTest, BuilderEncodesCategoricals) {
    data::TransactionRecord ios = test::Txn(2);
    ios.device = "ios";
    auto table = test::BuildTable({test::Txn(1), ios, test::Failed(test::Txn(3))});

    ASSERT_EQ(table->size(), 3u);
    auto device = table->CategoricalIndex("device");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(table->Cardinality(*device), 2u);
    EXPECT_EQ(table->value(*device, 1), "iOS");
    EXPECT_EQ(table->code(*device, 0), table->code(*device, 2));
    EXPECT_TRUE(table->CodeOf(*device, "iOS").has_value());
    EXPECT_FALSE(table->CodeOf(*device, "Web").has_value());

    EXPECT_FALSE(table->failed(0));
    EXPECT_TRUE(table->failed(2));
    EXPECT_EQ(table->transaction_id(1), "TXN2");
}

TEST(TransactionTableTest, BuilderRejectsValuesOutsideSchema) {
    TransactionTable::Builder builder;

    data::TransactionRecord record = test::Txn(1);
    record.device = "Blackberry";
    absl::Status status = builder.Append(record);

    EXPECT_EQ(status.code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(status.message().find("Blackberry"), std::string::npos);
    EXPECT_NE(status.message().find("device"), std::string::npos);
    EXPECT_EQ(builder.size(), 0u);
}

TEST(TransactionTableTest, BuilderRejectsNegativeAmount) {
    TransactionTable::Builder builder;

    data::TransactionRecord record = test::Txn(1);
    record.amount = -5.0;

    EXPECT_FALSE(builder.Append(record).ok());
}

TEST(TransactionTableTest, DomainSpansTimestamps) {
    data::TransactionRecord late = test::Txn(2);
    late.timestamp = test::At(2024, 2, 10);
    data::TransactionRecord early = test::Txn(3);
    early.timestamp = test::At(2023, 12, 31);

    auto table = test::BuildTable({test::Txn(1), late, early});

    EXPECT_EQ(table->domain().min, test::At(2023, 12, 31));
    EXPECT_EQ(table->domain().max, test::At(2024, 2, 10));
}

TEST(TransactionTableTest, ParseCsvLoadsRowsAndSkipsBadOnes) {
    std::stringstream csv;
    csv << kHeader
        << "T1,2024-01-01 10:00:00,250.50,UPI,Android,Maharashtra,25-34,4G,Food,Success,,0,0\n"
        << "T2,2024-01-02 11:00:00,99,card,iOS,\"Uttar Pradesh\",<25,WiFi,Travel,Failed,"
           "TIMEOUT,1,1\n"
        << "T3,not-a-date,10,UPI,Android,Delhi,45+,5G,Food,Success,,0,0\n"
        << "T4,2024-01-03,10,UPI,Blackberry,Delhi,45+,5G,Food,Success,,0,0\n"
        << "T5,2024-01-03,10,UPI,Web,Delhi\n"
        << "\n";

    LoadSummary summary;
    auto table = TransactionTable::ParseCsv(csv, DatasetSchema::Default(), &summary);
    ASSERT_TRUE(table.ok()) << table.status().message();

    EXPECT_EQ((*table)->size(), 2u);
    EXPECT_EQ(summary.rows_loaded, 2u);
    EXPECT_EQ(summary.rows_rejected, 3u);
    EXPECT_EQ(summary.domain.min, test::At(2024, 1, 1, 10));

    auto state = (*table)->CategoricalIndex("state");
    auto payment = (*table)->CategoricalIndex("payment_method");
    ASSERT_TRUE(state && payment);
    EXPECT_EQ((*table)->value(*state, 1), "Uttar Pradesh");
    EXPECT_EQ((*table)->value(*payment, 1), "Card");
    EXPECT_DOUBLE_EQ((*table)->amount(0), 250.5);
    EXPECT_TRUE((*table)->fraud(1));
    EXPECT_TRUE((*table)->failed(1));
}

TEST(TransactionTableTest, HeaderIsCaseInsensitive) {
    std::stringstream csv;
    csv << "Transaction_ID,TIMESTAMP,Amount,payment_method,device,state,age_group,network,"
           "category,status,failure_code,fraud_flag,review_flag\n"
        << "T1,2024-01-01,10,UPI,Web,Kerala,35-44,3G,Utilities,Success,,0,0\n";

    auto table = TransactionTable::ParseCsv(csv);
    ASSERT_TRUE(table.ok()) << table.status().message();
    EXPECT_EQ((*table)->size(), 1u);
}

TEST(TransactionTableTest, MissingColumnsFailTheLoad) {
    std::stringstream csv;
    csv << "transaction_id,timestamp,amount\n"
        << "T1,2024-01-01,10\n";

    auto table = TransactionTable::ParseCsv(csv);
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(table.status().message().find("missing required columns"), std::string::npos);
    EXPECT_NE(table.status().message().find("device"), std::string::npos);
}

TEST(TransactionTableTest, EmptyInputFails) {
    std::stringstream empty;
    EXPECT_FALSE(TransactionTable::ParseCsv(empty).ok());

    std::stringstream header_only;
    header_only << kHeader;
    auto table = TransactionTable::ParseCsv(header_only);
    ASSERT_FALSE(table.ok());
    EXPECT_NE(table.status().message().find("no valid rows"), std::string::npos);
}

TEST(TransactionTableTest, LoadCsvMissingFile) {
    auto table = TransactionTable::LoadCsv("/nonexistent/transactions.csv");
    ASSERT_FALSE(table.ok());
    EXPECT_EQ(table.status().code(), absl::StatusCode::kNotFound);
}

}  // namespace
}  // namespace insightx::data
