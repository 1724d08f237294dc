#include "utils/cache/lru_cache.hpp"

#include <gtest/gtest.h>

#include <string>

namespace photoreel {
namespace {

TEST(LruCacheTest, Put_BeyondCapacity_EvictsLeastRecent) {
  LruCache<std::string, int> cache(2);
  cache.Put("a", 1);
  cache.Put("b", 2);
  ASSERT_EQ(cache.Get("a"), 1);  // "b" becomes least recent
  cache.Put("c", 3);

  EXPECT_TRUE(cache.Contains("a"));
  EXPECT_FALSE(cache.Contains("b"));
  EXPECT_TRUE(cache.Contains("c"));
  EXPECT_EQ(cache.Size(), 2u);
  EXPECT_EQ(cache.Evictions(), 1u);
}

TEST(LruCacheTest, Put_ExistingKey_ReplacesWithoutEviction) {
  LruCache<std::string, int> cache(2);
  cache.Put("a", 1);
  cache.Put("b", 2);
  cache.Put("a", 10);
  EXPECT_EQ(cache.Get("a"), 10);
  EXPECT_EQ(cache.Size(), 2u);
  EXPECT_EQ(cache.Evictions(), 0u);
}

TEST(LruCacheTest, SetCapacity_ShrinksFromTheBack) {
  LruCache<int, int> cache(4);
  for (int i = 0; i < 4; ++i) {
    cache.Put(i, i * i);
  }
  cache.SetCapacity(2);
  EXPECT_EQ(cache.Size(), 2u);
  EXPECT_TRUE(cache.Contains(3));
  EXPECT_TRUE(cache.Contains(2));
  EXPECT_FALSE(cache.Contains(0));

  const auto evicted = cache.Evict();
  ASSERT_TRUE(evicted.has_value());
  EXPECT_EQ(evicted->first, 2);
}

TEST(LruCacheTest, EraseAndClear) {
  LruCache<int, int> cache;
  EXPECT_EQ(cache.Capacity(), (LruCache<int, int>::kDefaultCapacity));
  cache.Put(1, 1);
  cache.Put(2, 2);
  cache.Erase(1);
  EXPECT_FALSE(cache.Get(1).has_value());
  cache.Clear();
  EXPECT_EQ(cache.Size(), 0u);
  EXPECT_FALSE(cache.Evict().has_value());
}

}  // namespace
}  // namespace photoreel
