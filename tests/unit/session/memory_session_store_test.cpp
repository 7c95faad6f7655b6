/// @file memory_session_store_test.cpp
/// @brief Tests for the in-process session store and session serialisation

#include <gtest/gtest.h>

#include "common/error.h"
#include "session/memory_session_store.h"
#include "session/redis_session_store.h"
#include "support/fakes.h"

namespace insightx::session {
namespace {

SessionState NewState(const std::string& id) {
    SessionState state;
    state.session_id = id;
    return state;
}

class MemorySessionStoreTest : public ::testing::Test {
protected:
    MemorySessionStore MakeStore(size_t max_sessions, absl::Duration idle_ttl) {
        MemorySessionStoreConfig config;
        config.max_sessions = max_sessions;
        config.idle_ttl = idle_ttl;
        return MemorySessionStore(config, [this] { return now_; });
    }

    absl::Time now_ = test::At(2024, 1, 1);
};

TEST_F(MemorySessionStoreTest, PutAndGet) {
    auto store = MakeStore(10, absl::Hours(1));

    SessionState state = NewState("s1");
    state.request_timestamps.push_back(now_);
    ASSERT_TRUE(store.Put(state).ok());

    auto loaded = store.Get("s1");
    ASSERT_TRUE(loaded.ok());
    ASSERT_TRUE(loaded->has_value());
    EXPECT_EQ((*loaded)->request_timestamps.size(), 1u);

    auto missing = store.Get("unknown");
    ASSERT_TRUE(missing.ok());
    EXPECT_FALSE(missing->has_value());
}

TEST_F(MemorySessionStoreTest, LeastRecentlyUsedIsDropped) {
    auto store = MakeStore(2, absl::Hours(1));

    ASSERT_TRUE(store.Put(NewState("a")).ok());
    ASSERT_TRUE(store.Put(NewState("b")).ok());
    ASSERT_TRUE(store.Get("a").ok());
    ASSERT_TRUE(store.Put(NewState("c")).ok());

    EXPECT_EQ(store.Size(), 2u);
    EXPECT_TRUE(store.Get("a")->has_value());
    EXPECT_FALSE(store.Get("b")->has_value());
    EXPECT_TRUE(store.Get("c")->has_value());
}

TEST_F(MemorySessionStoreTest, IdleSessionsExpire) {
    auto store = MakeStore(10, absl::Hours(1));
    ASSERT_TRUE(store.Put(NewState("s1")).ok());

    now_ += absl::Minutes(30);
    EXPECT_TRUE(store.Get("s1")->has_value());

    now_ += absl::Minutes(61);
    EXPECT_FALSE(store.Get("s1")->has_value());
    EXPECT_EQ(store.Size(), 0u);
}

TEST_F(MemorySessionStoreTest, Evict) {
    auto store = MakeStore(10, absl::Hours(1));
    ASSERT_TRUE(store.Put(NewState("s1")).ok());

    EXPECT_TRUE(store.Evict("s1").ok());
    EXPECT_TRUE(store.Evict("never-stored").ok());
    EXPECT_FALSE(store.Get("s1")->has_value());
    EXPECT_EQ(store.Name(), "memory");
}

// =============================================================================
// Serialisation
// =============================================================================

TEST(SessionStateTest, StoredFormReadsBack) {
    SessionState state = NewState("s1");
    state.created_at = test::At(2024, 1, 1);
    state.last_active = test::At(2024, 1, 1, 13);
    state.request_timestamps = {test::At(2024, 1, 1, 13)};

    Turn turn;
    turn.question = "What is the failure rate on Android?";
    turn.intent.operation = analysis::Operation::kFailureRate;
    turn.intent.filters = {
        {"device", analysis::FilterConstraint::Kind::kEquals, {"Android"}, {}, {}}};
    turn.intent.confidence = 0.9;
    turn.answer_kind = "analysis";
    turn.result_summary = "Failure Rate: 3.45%";
    turn.timestamp = test::At(2024, 1, 1, 13);
    state.turns.push_back(turn);

    auto restored = SessionStateFromJson(nlohmann::json::parse(ToJson(state).dump()));
    ASSERT_TRUE(restored.ok()) << restored.status().message();

    EXPECT_EQ(restored->session_id, "s1");
    EXPECT_EQ(restored->last_active, state.last_active);
    EXPECT_EQ(restored->request_timestamps, state.request_timestamps);
    ASSERT_EQ(restored->turns.size(), 1u);
    EXPECT_EQ(restored->turns[0].question, turn.question);
    EXPECT_EQ(restored->turns[0].intent, turn.intent);
    EXPECT_TRUE(restored->turns[0].IsAnalysis());
}

TEST(SessionStateTest, MalformedDocument) {
    auto restored = SessionStateFromJson(nlohmann::json{{"session_id", 42}});
    ASSERT_FALSE(restored.ok());
    EXPECT_EQ(GetErrorCode(restored.status()), ErrorCode::kDeserializationError);
}

TEST(RedisSessionStoreTest, KeysAreNamespaced) {
    EXPECT_EQ(RedisSessionStore::KeyFor("abc"), "insightx:session:abc");
}

}  // namespace
}  // namespace insightx::session
