/**
 * @file lru_cache_test.cpp
 * @brief Tests for the bounded LRU cache.
 */

#include "termwidth/lru_cache.h"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using namespace termwidth;

TEST(LruCacheTest, GetMissingReturnsNullopt) {
  LruCache<int, std::string> cache(2);
  EXPECT_FALSE(cache.get(1).has_value());
  EXPECT_EQ(cache.size(), 0u);
}

TEST(LruCacheTest, PutThenGet) {
  LruCache<int, std::string> cache(2);
  cache.put(1, "one");
  ASSERT_TRUE(cache.get(1).has_value());
  EXPECT_EQ(*cache.get(1), "one");
}

TEST(LruCacheTest, PutOverwritesValue) {
  LruCache<int, std::string> cache(2);
  cache.put(1, "one");
  cache.put(1, "uno");
  EXPECT_EQ(*cache.get(1), "uno");
  EXPECT_EQ(cache.size(), 1u);
}

TEST(LruCacheTest, EvictsLeastRecentlyUsed) {
  LruCache<int, int> cache(2);
  cache.put(1, 10);
  cache.put(2, 20);
  cache.put(3, 30);

  EXPECT_FALSE(cache.peek(1).has_value());
  EXPECT_TRUE(cache.peek(2).has_value());
  EXPECT_TRUE(cache.peek(3).has_value());
  EXPECT_EQ(cache.size(), 2u);
}

TEST(LruCacheTest, GetPromotesEntry) {
  LruCache<int, int> cache(2);
  cache.put(1, 10);
  cache.put(2, 20);
  cache.get(1);
  cache.put(3, 30);

  EXPECT_TRUE(cache.peek(1).has_value());
  EXPECT_FALSE(cache.peek(2).has_value());
}

TEST(LruCacheTest, ContainsPromotesEntry) {
  LruCache<int, int> cache(2);
  cache.put(1, 10);
  cache.put(2, 20);
  EXPECT_TRUE(cache.contains(1));
  cache.put(3, 30);

  EXPECT_TRUE(cache.contains(1));
  EXPECT_FALSE(cache.contains(2));
}

TEST(LruCacheTest, PeekDoesNotPromote) {
  LruCache<int, int> cache(2);
  cache.put(1, 10);
  cache.put(2, 20);
  EXPECT_EQ(*cache.peek(1), 10);
  cache.put(3, 30);

  EXPECT_FALSE(cache.peek(1).has_value());
}

TEST(LruCacheTest, PutExistingPromotes) {
  LruCache<int, int> cache(2);
  cache.put(1, 10);
  cache.put(2, 20);
  cache.put(1, 11);
  cache.put(3, 30);

  EXPECT_EQ(*cache.peek(1), 11);
  EXPECT_FALSE(cache.peek(2).has_value());
}

TEST(LruCacheTest, ZeroCapacityStoresNothing) {
  LruCache<int, int> cache(0);
  cache.put(1, 10);
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get(1).has_value());
  EXPECT_EQ(cache.capacity(), 0u);
}

TEST(LruCacheTest, EraseAndClear) {
  LruCache<int, int> cache(3);
  cache.put(1, 10);
  cache.put(2, 20);

  EXPECT_TRUE(cache.erase(1));
  EXPECT_FALSE(cache.erase(1));
  EXPECT_EQ(cache.size(), 1u);

  cache.clear();
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_FALSE(cache.get(2).has_value());
}

TEST(LruCacheTest, ConcurrentAccessKeepsBound) {
  LruCache<int, int> cache(64);
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 1000; ++i) {
        int key = (i * 7 + t) % 200;
        if (auto value = cache.get(key)) {
          EXPECT_EQ(*value, key * 2);
        } else {
          cache.put(key, key * 2);
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_LE(cache.size(), 64u);
}
