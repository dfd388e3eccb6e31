#include "wlru/cache.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace wlru {
namespace {

using Keys = std::vector<std::string>;

class CapacityTenTest : public ::testing::Test {
protected:
    CapacityTenTest() : cache(10) {}

    void TearDown() override { cache.CheckInvariants(); }

    WeightedLruCache<std::string, int> cache;
};

TEST_F(CapacityTenTest, ThirdInsertEvictsOldest) {
    ASSERT_EQ(cache.Put("a", 1, 3), PutResult::kOk);
    ASSERT_EQ(cache.Put("b", 2, 4), PutResult::kOk);
    ASSERT_EQ(cache.Put("c", 3, 5), PutResult::kOk);

    EXPECT_EQ(cache.KeysByRecency(), (Keys{"b", "c"}));
    EXPECT_EQ(cache.Size(), 9u);
    EXPECT_FALSE(cache.Get("a").has_value());
}

TEST_F(CapacityTenTest, ReadPromotesBeforeEviction) {
    cache.Put("a", 1, 3);
    cache.Put("b", 2, 4);
    cache.Put("c", 3, 5);

    auto b = cache.Get("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, 2);

    ASSERT_EQ(cache.Put("d", 4, 3), PutResult::kOk);
    EXPECT_EQ(cache.KeysByRecency(), (Keys{"b", "d"}));
    EXPECT_EQ(cache.Size(), 7u);
    EXPECT_FALSE(cache.Contains("c"));
}

TEST_F(CapacityTenTest, OversizeOnEmptyCache) {
    EXPECT_EQ(cache.Put("huge", 1, 15), PutResult::kWeightExceedsCapacity);
    EXPECT_EQ(cache.Len(), 0u);
    EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(CapacityTenTest, ExactFitThenEvict) {
    cache.Put("a", 1, 5);
    cache.Put("b", 2, 5);
    EXPECT_EQ(cache.Size(), 10u);
    EXPECT_EQ(cache.Len(), 2u);

    cache.Put("c", 3, 5);
    EXPECT_EQ(cache.KeysByRecency(), (Keys{"b", "c"}));
    EXPECT_EQ(cache.Size(), 10u);
}

TEST_F(CapacityTenTest, ReplaceWithLargerWeight) {
    cache.Put("a", 1, 3);
    ASSERT_EQ(cache.Put("a", 10, 8), PutResult::kOk);
    EXPECT_EQ(cache.Size(), 8u);
    EXPECT_EQ(cache.Len(), 1u);
    EXPECT_EQ(*cache.Get("a"), 10);
    EXPECT_EQ(cache.Stats().evictions, 0u);
}

TEST_F(CapacityTenTest, EvictsNothingMoreThanNeeded) {
    cache.Put("a", 1, 2);
    cache.Put("b", 2, 2);
    cache.Put("c", 3, 2);
    cache.Put("d", 4, 2);
    cache.Put("e", 5, 2);
    // 10 used, 3 needed: a + b (4) is the shortest prefix freeing enough.
    cache.Put("f", 6, 3);
    EXPECT_EQ(cache.KeysByRecency(), (Keys{"c", "d", "e", "f"}));
    EXPECT_EQ(cache.Size(), 9u);
    EXPECT_EQ(cache.Stats().evictions, 2u);
}

TEST_F(CapacityTenTest, ExactCapacityEntryDrainsCache) {
    cache.Put("a", 1, 4);
    cache.Put("b", 2, 4);
    ASSERT_EQ(cache.Put("full", 9, 10), PutResult::kOk);
    EXPECT_EQ(cache.KeysByRecency(), (Keys{"full"}));
    EXPECT_EQ(cache.Size(), 10u);
}

} // namespace
} // namespace wlru
