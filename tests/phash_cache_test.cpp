#include "test_base.hpp"
#include "core/phash_cache.hpp"
#include <nlohmann/json.hpp>

class PhashCacheTest : public TestBase
{
};

TEST_F(PhashCacheTest, MissingFileLoadsEmpty)
{
    PhashCache cache;
    EXPECT_TRUE(cache.load(pathIn("absent.json")));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(PhashCacheTest, SavedFileUsesFlatCamelCaseFormat)
{
    PhashCache cache;
    PhashCacheEntry entry;
    entry.perceptual_hash = "C3A1F0E0D0C0B0A0";
    entry.size_bytes = 1234;
    entry.modified_time = 1700000000123456789LL;
    entry.path = "/data/a.png";
    cache.put("a.png", entry);

    PhashCacheEntry undecodable;
    undecodable.size_bytes = 10;
    undecodable.modified_time = 5;
    cache.put("broken.jpg", undecodable);

    std::string file = pathIn("cache.json");
    ASSERT_TRUE(cache.save(file));

    std::ifstream in(file);
    nlohmann::json document = nlohmann::json::parse(in);
    ASSERT_TRUE(document.is_object());
    EXPECT_EQ(document["a.png"]["perceptualHash"], "C3A1F0E0D0C0B0A0");
    EXPECT_EQ(document["a.png"]["sizeBytes"], 1234);
    EXPECT_EQ(document["a.png"]["modifiedTime"].get<int64_t>(), 1700000000123456789LL);
    EXPECT_EQ(document["a.png"]["path"], "/data/a.png");
    EXPECT_EQ(document["broken.jpg"]["perceptualHash"], "");

    PhashCache reloaded;
    ASSERT_TRUE(reloaded.load(file));
    EXPECT_EQ(reloaded.size(), 2u);
    auto hit = reloaded.lookup("a.png", 1700000000123456789LL);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->size_bytes, 1234u);
    EXPECT_TRUE(reloaded.lookup("broken.jpg", 5).has_value());
}

TEST_F(PhashCacheTest, ModificationTimeMismatchIsAMiss)
{
    PhashCache cache;
    PhashCacheEntry entry;
    entry.perceptual_hash = "0000000000000001";
    entry.modified_time = 100;
    cache.put("x.png", entry);

    EXPECT_TRUE(cache.lookup("x.png", 100).has_value());
    EXPECT_FALSE(cache.lookup("x.png", 101).has_value());
    EXPECT_FALSE(cache.lookup("y.png", 100).has_value());
}

TEST_F(PhashCacheTest, MalformedFileYieldsEmptyCache)
{
    std::string file = pathIn("cache.json");
    writeFile(file, "{ this is not json");

    PhashCache cache;
    PhashCacheEntry stale;
    cache.put("old.png", stale);
    EXPECT_FALSE(cache.load(file));
    EXPECT_EQ(cache.size(), 0u);
}

TEST_F(PhashCacheTest, MalformedEntriesAreSkipped)
{
    std::string file = pathIn("cache.json");
    writeFile(file, R"({
        "good.png": {"perceptualHash": "FFFF0000FFFF0000", "sizeBytes": 5, "modifiedTime": 9, "path": "p"},
        "bad.png": {"perceptualHash": 17},
        "worse.png": "nope"
    })");

    PhashCache cache;
    EXPECT_TRUE(cache.load(file));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_TRUE(cache.lookup("good.png", 9).has_value());
}
