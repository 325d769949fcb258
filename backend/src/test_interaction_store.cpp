#include <gtest/gtest.h>
#include <filesystem>
#include <thread>
#include <unistd.h>
#include "InteractionStore.hpp"

namespace fs = std::filesystem;

namespace {

InteractionEvent make_event(const std::string& user, const std::string& product,
                            InteractionKind kind = InteractionKind::View,
                            double duration = 0.0) {
    InteractionEvent event;
    event.user_id = user;
    event.product_id = product;
    event.kind = kind;
    event.timestamp = Clock::now();
    event.duration_seconds = duration;
    return event;
}

} // namespace

TEST(InteractionStoreTest, UnknownUserHasNoEvents) {
    InteractionStore store;
    EXPECT_TRUE(store.events_for("ghost").empty());
    EXPECT_TRUE(store.viewed_products("ghost").empty());
    EXPECT_EQ(store.user_count(), 0u);
}

TEST(InteractionStoreTest, NewestFirst) {
    InteractionStore store;
    store.append(make_event("u1", "p1"));
    store.append(make_event("u1", "p2"));
    store.append(make_event("u1", "p3"));

    auto events = store.events_for("u1");
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].product_id, "p3");
    EXPECT_EQ(events[1].product_id, "p2");
    EXPECT_EQ(events[2].product_id, "p1");
}

TEST(InteractionStoreTest, CapDropsOldestEvents) {
    InteractionStore store(100);
    for (int i = 0; i < 150; ++i) {
        store.append(make_event("u1", "p" + std::to_string(i)));
    }

    auto events = store.events_for("u1");
    ASSERT_EQ(events.size(), 100u);
    EXPECT_EQ(events.front().product_id, "p149");
    EXPECT_EQ(events.back().product_id, "p50");
    EXPECT_EQ(store.total_events(), 100u);
}

TEST(InteractionStoreTest, ViewedProductsOnlyCountsViews) {
    InteractionStore store;
    store.append(make_event("u1", "p1", InteractionKind::View));
    store.append(make_event("u1", "p2", InteractionKind::Purchase));
    store.append(make_event("u1", "p3", InteractionKind::AddToCart));
    store.append(make_event("u1", "p1", InteractionKind::View));

    auto viewed = store.viewed_products("u1");
    EXPECT_EQ(viewed.size(), 1u);
    EXPECT_EQ(viewed.count("p1"), 1u);
}

TEST(InteractionStoreTest, ConcurrentAppendsKeepEveryEvent) {
    InteractionStore store(1000);
    const int threads = 8;
    const int per_thread = 200;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&store, t]() {
            // Half the threads share one user, the rest write their own
            std::string user = (t % 2 == 0) ? "shared" : "u" + std::to_string(t);
            for (int i = 0; i < per_thread; ++i) {
                store.append(make_event(user, "p" + std::to_string(i)));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(store.events_for("shared").size(), 4u * per_thread);
    EXPECT_EQ(store.user_count(), 5u);
    EXPECT_EQ(store.total_events(), static_cast<size_t>(threads * per_thread));
}

TEST(InteractionStoreTest, SaveThenLoadKeepsOrderAndFields) {
    fs::path path = fs::temp_directory_path() /
                    ("interactions_test_" + std::to_string(::getpid()) + ".json");

    InteractionStore store;
    store.append(make_event("u1", "p1", InteractionKind::View, 45.0));
    store.append(make_event("u1", "p2", InteractionKind::Purchase));
    store.append(make_event("u2", "p3", InteractionKind::AddToWishlist));
    ASSERT_TRUE(store.save(path.string()));

    InteractionStore reloaded;
    ASSERT_TRUE(reloaded.load(path.string()));
    EXPECT_EQ(reloaded.user_count(), 2u);

    auto events = reloaded.events_for("u1");
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].product_id, "p2");
    EXPECT_EQ(events[0].kind, InteractionKind::Purchase);
    EXPECT_EQ(events[1].product_id, "p1");
    EXPECT_DOUBLE_EQ(events[1].duration_seconds, 45.0);
    EXPECT_EQ(events[1].user_id, "u1");

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(InteractionStoreTest, LoadMissingFileKeepsStoreEmpty) {
    InteractionStore store;
    EXPECT_FALSE(store.load("/nonexistent/interactions.json"));
    EXPECT_EQ(store.user_count(), 0u);
}
