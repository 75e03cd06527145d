/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Unit tests for LRUCache - single-threaded core functionality
 */

#include "gtest/gtest.h"
#include "../src/lru.h"
#include <cstdint>
#include <string>

using namespace textvault;

class LruUnitTest : public ::testing::Test {
protected:
    using Cache = LRUCache<int, int>;
    Cache cache{3};
};

// ============= Core Operations =============

TEST_F(LruUnitTest, AddAndGet) {
    EXPECT_FALSE(cache.add(1, 10).has_value());
    ASSERT_NE(cache.get(1), nullptr);
    EXPECT_EQ(*cache.get(1), 10);

    EXPECT_FALSE(cache.add(2, 20).has_value());
    EXPECT_EQ(*cache.get(2), 20);
    EXPECT_EQ(cache.size(), 2u);
}

TEST_F(LruUnitTest, MissReturnsNull) {
    EXPECT_EQ(cache.get(42), nullptr);
    EXPECT_EQ(cache.peek(42), nullptr);
    EXPECT_FALSE(cache.contains(42));
}

TEST_F(LruUnitTest, PeekDoesNotPromote) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    // Peek at 1 shouldn't affect LRU order
    const int* val = cache.peek(1);
    ASSERT_NE(val, nullptr);
    EXPECT_EQ(*val, 10);

    auto victim = cache.removeOne();
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, 1);
}

TEST_F(LruUnitTest, GetPromotesToMRU) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    cache.get(1);

    // Now 2 should be LRU
    auto victim = cache.removeOne();
    ASSERT_TRUE(victim.has_value());
    EXPECT_EQ(*victim, 2);
}

TEST_F(LruUnitTest, AddBeyondCapacityEvictsLRU) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    auto evicted = cache.add(4, 40);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, 1);
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(4));
}

TEST_F(LruUnitTest, ReAddReplacesAndPromotes) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    EXPECT_FALSE(cache.add(1, 11).has_value());
    EXPECT_EQ(cache.size(), 3u);
    EXPECT_EQ(*cache.peek(1), 11);

    auto evicted = cache.add(4, 40);
    ASSERT_TRUE(evicted.has_value());
    EXPECT_EQ(*evicted, 2);
}

TEST_F(LruUnitTest, IdsAreLeastToMostRecent) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);
    cache.get(2);

    std::vector<int> expected = {1, 3, 2};
    EXPECT_EQ(cache.ids(), expected);
}

// ============= Removal =============

TEST_F(LruUnitTest, RemoveSpecificId) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    EXPECT_TRUE(cache.remove(2));
    EXPECT_FALSE(cache.remove(2));
    EXPECT_EQ(cache.size(), 2u);

    std::vector<int> expected = {1, 3};
    EXPECT_EQ(cache.ids(), expected);
}

TEST_F(LruUnitTest, RemoveHeadAndTail) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    EXPECT_TRUE(cache.remove(3));   // MRU
    EXPECT_TRUE(cache.remove(1));   // LRU
    std::vector<int> expected = {2};
    EXPECT_EQ(cache.ids(), expected);

    EXPECT_TRUE(cache.remove(2));
    EXPECT_TRUE(cache.empty());
    EXPECT_FALSE(cache.removeOne().has_value());
}

TEST_F(LruUnitTest, ClearEmptiesEverything) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.clear();

    EXPECT_TRUE(cache.empty());
    EXPECT_TRUE(cache.ids().empty());

    // still usable afterwards
    cache.add(5, 50);
    EXPECT_EQ(*cache.get(5), 50);
}

TEST_F(LruUnitTest, ShrinkingCapacityEvicts) {
    cache.add(1, 10);
    cache.add(2, 20);
    cache.add(3, 30);

    cache.updateMaxEntries(1);
    EXPECT_EQ(cache.getMaxEntries(), 1u);
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.contains(3));
}

// ============= Value types =============

TEST(LruValueTest, OwnsNonTrivialValues) {
    LRUCache<uint64_t, std::string> strings(2);
    strings.add(0, std::string(1000, 'a'));
    strings.add(8192, "second");
    strings.add(16384, "third");

    EXPECT_FALSE(strings.contains(0));
    ASSERT_NE(strings.get(8192), nullptr);
    EXPECT_EQ(*strings.get(8192), "second");
}

TEST(LruValueTest, IndexAndListStayConsistent) {
    LRUCache<int, int> c(4);
    for (int i = 0; i < 100; i++) {
        c.add(i % 7, i);
        if (i % 5 == 0) c.get((i + 3) % 7);
        if (i % 11 == 0) c.remove((i + 1) % 7);

        auto ids = c.ids();
        EXPECT_EQ(ids.size(), c.size());
        EXPECT_LE(c.size(), 4u);
        for (int id : ids) {
            EXPECT_TRUE(c.contains(id));
        }
    }
}
