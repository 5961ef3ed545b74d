#include "filest/transfer/session_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using filest::transfer::SessionStore;
using filest::transfer::UploadSession;

namespace {

UploadSession make_session(const std::string& id, std::uint32_t chunks) {
    UploadSession session;
    session.upload_id = id;
    session.filename = "file.bin";
    session.total_chunks = chunks;
    session.received.assign(chunks, false);
    session.created_at = std::chrono::system_clock::now();
    session.last_activity = std::chrono::steady_clock::now();
    return session;
}

} // namespace

TEST(SessionStoreTest, CreateGetRemove) {
    SessionStore store;
    ASSERT_TRUE(store.create(make_session("s1", 3)));
    EXPECT_FALSE(store.create(make_session("s1", 5)));
    EXPECT_EQ(store.size(), 1u);

    auto copy = store.get("s1");
    ASSERT_TRUE(copy.has_value());
    EXPECT_EQ(copy->total_chunks, 3u);

    auto removed = store.remove("s1");
    ASSERT_TRUE(removed.has_value());
    EXPECT_FALSE(store.contains("s1"));
    EXPECT_FALSE(store.remove("s1").has_value());
    EXPECT_FALSE(store.get("s1").has_value());
}

TEST(SessionStoreTest, GetReturnsSnapshot) {
    SessionStore store;
    store.create(make_session("s1", 2));

    auto copy = store.get("s1");
    copy->received[0] = true;

    EXPECT_EQ(store.get("s1")->received_count(), 0u);
}

TEST(SessionStoreTest, MissingChunksListsUnreceivedIndices) {
    auto session = make_session("s1", 5);
    session.received[0] = true;
    session.received[3] = true;
    EXPECT_EQ(session.missing_chunks(), (std::vector<std::uint32_t>{1, 2, 4}));
    EXPECT_EQ(session.received_count(), 2u);
}

TEST(SessionStoreTest, MutateUnknownSessionFails) {
    SessionStore store;
    EXPECT_FALSE(store.mutate("nope", [](UploadSession&) {}));
}

TEST(SessionStoreTest, ConcurrentMarksDoNotLoseUpdates) {
    constexpr std::uint32_t kChunks = 4000;
    constexpr int kThreads = 8;

    SessionStore store;
    store.create(make_session("shared", kChunks));

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (std::uint32_t i = static_cast<std::uint32_t>(t); i < kChunks; i += kThreads) {
                store.mutate("shared", [i](UploadSession& session) { session.received[i] = true; });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto session = store.get("shared");
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->received_count(), kChunks);
    EXPECT_TRUE(session->missing_chunks().empty());
}

TEST(SessionStoreTest, OnlyOneConcurrentRemoveWins) {
    SessionStore store;
    store.create(make_session("race", 1));

    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            if (store.remove("race")) {
                winners++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST(SessionStoreTest, RemoveExpiredUsesLastActivity) {
    SessionStore store;
    const auto now = std::chrono::steady_clock::now();

    auto stale = make_session("stale", 1);
    stale.last_activity = now - std::chrono::seconds(120);
    auto fresh = make_session("fresh", 1);
    fresh.last_activity = now - std::chrono::seconds(10);
    store.create(stale);
    store.create(fresh);

    auto expired = store.remove_expired(now, std::chrono::seconds(60));
    ASSERT_EQ(expired.size(), 1u);
    EXPECT_EQ(expired[0].upload_id, "stale");
    EXPECT_TRUE(store.contains("fresh"));
    EXPECT_FALSE(store.contains("stale"));
}
