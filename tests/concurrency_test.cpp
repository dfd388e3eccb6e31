#include "wlru/cache.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace wlru {
namespace {

TEST(WeightedLruCacheConcurrencyTest, MixedWorkloadKeepsInvariants) {
    WeightedLruCache<std::string, std::string> cache(2048);
    std::atomic<std::uint64_t> evicted{0};
    cache.SetEvictionListener([&](const std::string&, const std::string&, Weight) {
        evicted.fetch_add(1, std::memory_order_relaxed);
    });

    constexpr int kThreads = 8;
    constexpr int kOpsPerThread = 5000;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&cache, t] {
            std::mt19937 rng(t);
            std::uniform_int_distribution<int> key_dist(0, 255);
            std::uniform_int_distribution<int> weight_dist(1, 128);
            std::uniform_int_distribution<int> op_dist(0, 9);
            for (int i = 0; i < kOpsPerThread; ++i) {
                std::string key = "k" + std::to_string(key_dist(rng));
                int op = op_dist(rng);
                if (op < 6) {
                    cache.Get(key);
                } else if (op < 9) {
                    int w = weight_dist(rng);
                    EXPECT_EQ(cache.Put(key, std::string(static_cast<std::size_t>(w), 'x'), w), PutResult::kOk);
                } else {
                    cache.Remove(key);
                }
                EXPECT_LE(cache.Size(), 2048u);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    cache.CheckInvariants();
    EXPECT_EQ(cache.Stats().evictions, evicted.load());
    for (const auto& key : cache.KeysByRecency()) {
        auto value = cache.Peek(key);
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(value->size(), *cache.WeightOf(key));
    }
}

} // namespace
} // namespace wlru
