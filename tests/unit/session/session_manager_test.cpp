/// @file session_manager_test.cpp
/// @brief Tests for conversation memory and per-session rate limiting

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "session/memory_session_store.h"
#include "session/session_manager.h"
#include "support/fakes.h"

namespace insightx::session {
namespace {

Turn MakeTurn(const std::string& question) {
    Turn turn;
    turn.question = question;
    turn.answer_kind = "analysis";
    return turn;
}

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemorySessionStore>();
        SessionManagerConfig config;
        config.context_window = 3;
        config.requests_per_minute = 3;
        manager_ = std::make_unique<SessionManager>(store_, config, [this] { return now_; });
    }

    absl::Time now_ = test::At(2024, 1, 1);
    std::shared_ptr<MemorySessionStore> store_;
    std::unique_ptr<SessionManager> manager_;
};

TEST_F(SessionManagerTest, UnknownSessionIsEmptyAndNotStored) {
    auto state = manager_->Get("s1");
    ASSERT_TRUE(state.ok());

    EXPECT_EQ(state->session_id, "s1");
    EXPECT_TRUE(state->turns.empty());
    EXPECT_EQ(state->created_at, now_);
    EXPECT_EQ(store_->Size(), 0u);
}

TEST_F(SessionManagerTest, AppendKeepsContextWindow) {
    for (int i = 1; i <= 5; ++i) {
        ASSERT_TRUE(manager_->Append("s1", MakeTurn(absl::StrCat("q", i))).ok());
    }

    auto state = manager_->Get("s1");
    ASSERT_TRUE(state.ok());
    ASSERT_EQ(state->turns.size(), 3u);
    EXPECT_EQ(state->turns[0].question, "q3");
    EXPECT_EQ(state->turns[2].question, "q5");
    EXPECT_EQ(state->turns[2].timestamp, now_);
}

TEST_F(SessionManagerTest, RequestBeyondLimitIsRejectedWithoutMutation) {
    ASSERT_TRUE(manager_->Append("s1", MakeTurn("q1")).ok());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->CheckAndRecord("s1").ok());
    }

    absl::Status limited = manager_->CheckAndRecord("s1");
    EXPECT_EQ(GetErrorCode(limited), ErrorCode::kRateLimited);

    auto state = manager_->Get("s1");
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(state->turns.size(), 1u);
    EXPECT_EQ(state->request_timestamps.size(), 3u);

    SessionManagerStats stats = manager_->GetStats();
    EXPECT_EQ(stats.requests_admitted, 3u);
    EXPECT_EQ(stats.requests_rate_limited, 1u);
}

TEST_F(SessionManagerTest, WindowSlides) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->CheckAndRecord("s1").ok());
    }

    now_ += absl::Seconds(30);
    EXPECT_FALSE(manager_->CheckAndRecord("s1").ok());

    // Requests exactly one window old no longer count
    now_ += absl::Seconds(30);
    EXPECT_TRUE(manager_->CheckAndRecord("s1").ok());

    auto state = manager_->Get("s1");
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(state->request_timestamps.size(), 1u);
}

TEST_F(SessionManagerTest, SessionsAreLimitedIndependently) {
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->CheckAndRecord("s1").ok());
    }
    EXPECT_FALSE(manager_->CheckAndRecord("s1").ok());
    EXPECT_TRUE(manager_->CheckAndRecord("s2").ok());
    EXPECT_EQ(manager_->GetStats().sessions_created, 2u);
}

TEST_F(SessionManagerTest, ResetForgetsTurnsAndRateHistory) {
    ASSERT_TRUE(manager_->Append("s1", MakeTurn("q1")).ok());
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(manager_->CheckAndRecord("s1").ok());
    }

    ASSERT_TRUE(manager_->Reset("s1").ok());

    auto state = manager_->Get("s1");
    ASSERT_TRUE(state.ok());
    EXPECT_TRUE(state->turns.empty());
    EXPECT_TRUE(manager_->CheckAndRecord("s1").ok());
    EXPECT_EQ(manager_->GetStats().resets, 1u);
}

TEST_F(SessionManagerTest, EmptySessionIdIsInvalid) {
    EXPECT_EQ(manager_->CheckAndRecord("").code(), absl::StatusCode::kInvalidArgument);
    EXPECT_EQ(manager_->Append("", MakeTurn("q")).code(), absl::StatusCode::kInvalidArgument);
    EXPECT_FALSE(manager_->Get("").ok());
}

TEST(SessionManagerLocksTest, DistinctSessionsDoNotAccumulateLocks) {
    MemorySessionStoreConfig store_config;
    store_config.max_sessions = 10;
    auto store = std::make_shared<MemorySessionStore>(store_config);
    SessionManager manager(store);

    for (int i = 0; i < 500; ++i) {
        std::string id = absl::StrCat("s", i);
        ASSERT_TRUE(manager.CheckAndRecord(id).ok());
        ASSERT_TRUE(manager.Append(id, MakeTurn("q")).ok());
        ASSERT_TRUE(manager.Get(id).ok());
    }
    ASSERT_TRUE(manager.Reset("s499").ok());

    EXPECT_EQ(manager.ActiveSessionLocks(), 0u);
    EXPECT_LE(store->Size(), 10u);
}

TEST(SessionManagerConcurrencyTest, ConcurrentRequestsAreNotLost) {
    auto store = std::make_shared<MemorySessionStore>();
    SessionManagerConfig config;
    config.requests_per_minute = 1000;
    config.context_window = 1000;
    SessionManager manager(store, config);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&manager, t]() {
            for (int i = 0; i < 10; ++i) {
                EXPECT_TRUE(manager.CheckAndRecord("shared").ok());
                EXPECT_TRUE(manager.Append("shared", MakeTurn(absl::StrCat(t, "-", i))).ok());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto state = manager.Get("shared");
    ASSERT_TRUE(state.ok());
    EXPECT_EQ(state->request_timestamps.size(), 80u);
    EXPECT_EQ(state->turns.size(), 80u);
    EXPECT_EQ(manager.ActiveSessionLocks(), 0u);
}

}  // namespace
}  // namespace insightx::session
