#pragma once

/// @file fakes.h
/// @brief Test doubles shared by unit and integration tests

#include <gtest/gtest.h>

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>
#include <absl/time/civil_time.h>
#include <absl/time/time.h>

#include "data/transaction_table.h"
#include "llm/language_model.h"

namespace insightx::test {

// =============================================================================
// Language model
// =============================================================================

/// @brief LanguageModel that replays queued responses and records requests
///
/// An empty queue answers kUnavailable, like an unreachable endpoint.
/// While held, calls block until Release(), like a model that never answers
/// within the caller's deadline.
class ScriptedModel : public llm::LanguageModel {
public:
    void Hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void Release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        released_.notify_all();
    }

    void Enqueue(std::string response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.emplace_back(std::move(response));
    }

    void EnqueueError(absl::Status status) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.emplace_back(std::move(status));
    }

    absl::StatusOr<std::string> Complete(const llm::CompletionRequest& request) override {
        std::unique_lock<std::mutex> lock(mutex_);
        requests_.push_back(request);
        released_.wait(lock, [this] { return !held_; });
        if (responses_.empty()) {
            return absl::UnavailableError("no scripted response");
        }
        absl::StatusOr<std::string> next = std::move(responses_.front());
        responses_.pop_front();
        return next;
    }

    std::string Name() const override { return "scripted-model"; }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    std::vector<llm::CompletionRequest> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable released_;
    bool held_ = false;
    std::deque<absl::StatusOr<std::string>> responses_;
    std::vector<llm::CompletionRequest> requests_;
};

// =============================================================================
// Transactions
// =============================================================================

inline absl::Time At(int year, int month, int day, int hour = 12) {
    return absl::FromCivil(absl::CivilSecond(year, month, day, hour, 0, 0),
                           absl::UTCTimeZone());
}

/// @brief A successful UPI payment on Android, 2024-01-01 noon, amount 100
inline data::TransactionRecord Txn(int index) {
    data::TransactionRecord record;
    record.transaction_id = absl::StrCat("TXN", index);
    record.timestamp = At(2024, 1, 1);
    record.amount = 100.0;
    record.payment_method = "UPI";
    record.device = "Android";
    record.state = "Maharashtra";
    record.age_group = "25-34";
    record.network = "4G";
    record.category = "Food";
    record.status = "Success";
    return record;
}

inline data::TransactionRecord Failed(data::TransactionRecord record,
                                      std::string code = "TIMEOUT") {
    record.status = "Failed";
    record.failure_code = std::move(code);
    return record;
}

inline std::shared_ptr<const data::TransactionTable> BuildTable(
    const std::vector<data::TransactionRecord>& records) {
    data::TransactionTable::Builder builder;
    for (const auto& record : records) {
        absl::Status status = builder.Append(record);
        EXPECT_TRUE(status.ok()) << status.message();
    }
    return builder.Build();
}

/// @brief 10,000 transactions over 90 days of 2024, every 29th one failed (345)
///
/// Devices rotate Android, iOS, Web; networks rotate 4G, 5G, WiFi, 3G.
inline std::shared_ptr<const data::TransactionTable> PaymentsTable() {
    static const char* kDevices[] = {"Android", "iOS", "Web"};
    static const char* kNetworks[] = {"4G", "5G", "WiFi", "3G"};
    static const char* kCodes[] = {"TIMEOUT", "BANK_DECLINED", "INSUFFICIENT_BALANCE"};

    std::vector<data::TransactionRecord> records;
    records.reserve(10000);
    for (int i = 0; i < 10000; ++i) {
        data::TransactionRecord record = Txn(i);
        record.timestamp = At(2024, 1, 1) + absl::Hours(24 * (i % 90));
        record.amount = 50.0 + (i % 20) * 25.0;
        record.device = kDevices[i % 3];
        record.network = kNetworks[i % 4];
        record.fraud_flag = i % 500 == 0;
        if (i % 29 == 0) {
            record = Failed(std::move(record), kCodes[(i / 29) % 3]);
        }
        records.push_back(std::move(record));
    }
    return BuildTable(records);
}

}  // namespace insightx::test
