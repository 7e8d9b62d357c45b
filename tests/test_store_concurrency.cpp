/**
 * @file test_store_concurrency.cpp
 * @brief Multi-threaded Store tests
 */

#include <memkv/store.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace memkv;

TEST(StoreConcurrencyTest, ParallelWritersDistinctKeys) {
    Store store;
    constexpr int kThreads = 8;
    constexpr int kKeysPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kKeysPerThread; ++i) {
                std::string key = "t" + std::to_string(t) + ":" + std::to_string(i);
                ASSERT_TRUE(store.Set(key, std::to_string(i)).ok());
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(store.DbSize(), static_cast<size_t>(kThreads * kKeysPerThread));
    EXPECT_EQ(store.Keys("t3:*").size(), static_cast<size_t>(kKeysPerThread));
}

TEST(StoreConcurrencyTest, ReadersSeeCompleteValues) {
    Store store;
    const std::string a(256, 'a');
    const std::string b(256, 'b');
    ASSERT_TRUE(store.Set("shared", a).ok());

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::thread writer([&] {
        for (int i = 0; i < 5000; ++i) {
            ASSERT_TRUE(store.Set("shared", (i % 2) ? a : b).ok());
        }
        stop.store(true);
    });

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                auto value = store.Get("shared");
                if (!value.ok() || !value.value() || (*value.value() != a && *value.value() != b)) {
                    torn++;
                }
            }
        });
    }

    writer.join();
    for (auto& t : readers) t.join();
    EXPECT_EQ(torn.load(), 0);
}

TEST(StoreConcurrencyTest, ConcurrentZAddSameKey) {
    Store store;
    constexpr int kThreads = 4;
    constexpr int kMembers = 250;

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t] {
            for (int i = 0; i < kMembers; ++i) {
                std::string member = "m" + std::to_string(t * kMembers + i);
                ASSERT_TRUE(store.ZAdd("board", {{member, static_cast<double>(i)}}).ok());
            }
        });
    }
    for (auto& t : threads) t.join();

    auto card = store.ZCard("board");
    ASSERT_TRUE(card.ok());
    EXPECT_EQ(card.value(), kThreads * kMembers);

    auto all = store.ZRange("board", RankRange{0, -1});
    ASSERT_TRUE(all.ok());
    ASSERT_EQ(all.value().size(), static_cast<size_t>(kThreads * kMembers));
    for (size_t i = 1; i < all.value().size(); ++i) {
        EXPECT_LE(all.value()[i - 1].score, all.value()[i].score);
    }
}

// A reader that finds the key expired must not delete a value a writer
// stored after the expiry was observed.
TEST(StoreConcurrencyTest, LazyExpiryNeverDropsFreshWrite) {
    std::atomic<int64_t> now_ms{1'000'000};
    StoreOptions options;
    options.num_shards = 1;
    options.clock = [&now_ms] { return FromUnixMillis(now_ms.load()); };
    Store store(options);

    std::atomic<int> lost{0};
    for (int round = 0; round < 200; ++round) {
        SetOptions px;
        ASSERT_TRUE(px.SetExpiry(ExpiryKind::kPx, 10).ok());
        ASSERT_TRUE(store.Set("k", "old", px).ok());
        now_ms += 10;  // "old" is now expired

        std::atomic<bool> go{false};
        std::thread reader([&] {
            while (!go.load()) {}
            for (int i = 0; i < 50; ++i) {
                auto r = store.Get("k");
                if (r.ok() && r.value() && *r.value() == "old") lost++;
            }
        });
        std::thread writer([&] {
            while (!go.load()) {}
            ASSERT_TRUE(store.Set("k", "fresh").ok());
        });
        go.store(true);
        reader.join();
        writer.join();

        auto after = store.Get("k");
        ASSERT_TRUE(after.ok());
        ASSERT_TRUE(after.value().has_value()) << "round " << round;
        EXPECT_EQ(*after.value(), "fresh");
    }
    EXPECT_EQ(lost.load(), 0);
}

TEST(StoreConcurrencyTest, MixedWorkload) {
    // Frozen clock: nothing expires while the final scan runs
    StoreOptions options;
    const TimePoint frozen = Clock::now();
    options.clock = [frozen] { return frozen; };
    Store store(options);
    std::atomic<bool> stop{false};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, &stop, t] {
            int i = 0;
            while (!stop.load()) {
                std::string key = "k" + std::to_string(i % 64);
                switch ((i + t) % 6) {
                    case 0: (void)store.Set(key, "v"); break;
                    case 1: (void)store.Get(key); break;
                    case 2: (void)store.Del({key}); break;
                    case 3: (void)store.ZAdd("z" + key, {{"m", static_cast<double>(i)}}); break;
                    case 4: (void)store.Keys("k1*"); break;
                    case 5: (void)store.PExpire(key, 5); break;
                }
                ++i;
            }
        });
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    stop.store(true);
    for (auto& t : threads) t.join();

    // Every surviving key is still readable with a consistent type
    for (const auto& key : store.Keys("*")) {
        EXPECT_NE(store.Type(key), ValueKind::kNone) << key;
    }
}
