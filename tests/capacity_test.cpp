#include "wlru/capacity.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace wlru {
namespace {

TEST(CapacityAccountantTest, AdmitAndRelease) {
    CapacityAccountant acc(10);
    EXPECT_EQ(acc.Current(), 0u);
    acc.Admit(4);
    acc.Admit(3);
    EXPECT_EQ(acc.Current(), 7u);
    EXPECT_EQ(acc.Available(), 3u);
    acc.Release(4);
    EXPECT_EQ(acc.Current(), 3u);
}

TEST(CapacityAccountantTest, WouldExceedIsStrict) {
    CapacityAccountant acc(10);
    acc.Admit(7);
    EXPECT_FALSE(acc.WouldExceed(3));
    EXPECT_TRUE(acc.WouldExceed(4));
    EXPECT_FALSE(acc.WouldExceed(0));
}

TEST(CapacityAccountantTest, WouldExceedDoesNotWrap) {
    CapacityAccountant acc(10);
    acc.Admit(5);
    EXPECT_TRUE(acc.WouldExceed(std::numeric_limits<Weight>::max()));
}

TEST(CapacityAccountantTest, ShrinkBelowCurrent) {
    CapacityAccountant acc(10);
    acc.Admit(8);
    acc.SetCapacity(5);
    EXPECT_EQ(acc.Capacity(), 5u);
    EXPECT_EQ(acc.Available(), 0u);
    EXPECT_TRUE(acc.WouldExceed(0));
    acc.Reset();
    EXPECT_EQ(acc.Current(), 0u);
    EXPECT_FALSE(acc.WouldExceed(5));
}

} // namespace
} // namespace wlru
