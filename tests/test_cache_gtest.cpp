// ==============================================================================
// test_cache_gtest.cpp - Тесты кэша классификации (GoogleTest)
// ==============================================================================

#include "anirename/cache.hpp"

#include <gtest/gtest.h>

namespace anirename::rename::test {

TEST(ClassificationCacheTest, EmptyByDefault) {
    ClassificationCache cache;

    EXPECT_TRUE(cache.empty());
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.get("/anime/Show").has_value());
}

TEST(ClassificationCacheTest, PutThenGet) {
    ClassificationCache cache;

    cache.put("/anime/Show", {"Show", "01", "DMG"});
    auto hit = cache.get("/anime/Show");

    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->title, "Show");
    EXPECT_EQ(hit->season, "01");
    EXPECT_EQ(hit->release_group, "DMG");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ClassificationCacheTest, KeyedByDirectory) {
    ClassificationCache cache;

    cache.put("/anime/A", {"A", "01", "G1"});
    cache.put("/anime/B", {"B", "02", "G2"});

    EXPECT_EQ(cache.get("/anime/A")->title, "A");
    EXPECT_EQ(cache.get("/anime/B")->season, "02");
    EXPECT_FALSE(cache.get("/anime").has_value());
}

TEST(ClassificationCacheTest, PutOverwrites) {
    ClassificationCache cache;

    cache.put("/d", {"Old", "01", "G"});
    cache.put("/d", {"New", "03", "H"});

    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.get("/d")->title, "New");
}

TEST(ClassificationCacheTest, ClearDropsEverything) {
    ClassificationCache cache;
    cache.put("/d", {"T", "01", "G"});

    cache.clear();

    EXPECT_TRUE(cache.empty());
    EXPECT_FALSE(cache.get("/d").has_value());
}

}  // namespace anirename::rename::test
