#include "wlru/hash.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace wlru {
namespace {

TEST(HashTest, StableForEqualKeys) {
    Hasher<std::string> h;
    EXPECT_EQ(h("prefix/0.kv"), h(std::string("prefix/0.kv")));
    EXPECT_NE(h("prefix/0.kv"), h("prefix/1.kv"));
}

TEST(HashTest, SeedChangesDigest) {
    const std::string s = "weighted";
    EXPECT_EQ(HashBytes(s.data(), s.size()), HashBytes(s.data(), s.size(), 0));
    EXPECT_NE(HashBytes(s.data(), s.size()), HashBytes(s.data(), s.size(), 42));
}

TEST(HashTest, ByteVectorMatchesStringBytes) {
    const std::string s = "abc";
    const std::vector<std::uint8_t> v(s.begin(), s.end());
    EXPECT_EQ(Hasher<std::vector<std::uint8_t>>{}(v), Hasher<std::string>{}(s));
}

TEST(HashTest, EmptyInput) {
    Hasher<std::string> h;
    EXPECT_EQ(h(""), h(std::string()));
}

} // namespace
} // namespace wlru
