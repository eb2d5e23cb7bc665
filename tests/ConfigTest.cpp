#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/Config.hpp"

#include <string>

using qsde::core::Config;
using qsde::core::json;
using qsde::test::TempDir;
using qsde::test::writeFile;

TEST(ConfigTest, DefaultsCoverEverySection) {
    Config config;
    EXPECT_EQ(config.get<int>("engine.maxConcurrency"), 16);
    EXPECT_EQ(config.get<int>("engine.workerThreads"), 32);
    EXPECT_EQ(config.get<int>("engine.chunkSize"), 65536);
    EXPECT_TRUE(config.get<bool>("engine.createDirectories"));
    EXPECT_EQ(config.get<int>("network.timeoutSeconds"), 30);
    EXPECT_EQ(config.get<int>("retry.maxAttempts"), 3);
    EXPECT_EQ(config.get<int>("retry.maxIntegrityAttempts"), 2);
    EXPECT_DOUBLE_EQ(config.get<double>("retry.multiplier"), 2.0);
    EXPECT_EQ(config.get<int>("progress.queueCapacity"), 64);
    EXPECT_EQ(config.get<int>("cancel.gracePeriodMs"), 5000);
    EXPECT_EQ(config.get<std::string>("log.level"), "info");
}

TEST(ConfigTest, MissingOrMistypedKeysFallBackToDefault) {
    Config config;
    EXPECT_EQ(config.get<int>("engine.unknown", 7), 7);
    EXPECT_EQ(config.get<int>("network.userAgent", 3), 3);
    EXPECT_FALSE(config.has("nothing.here"));
    EXPECT_TRUE(config.has("retry.maxDelayMs"));
}

TEST(ConfigTest, SetCreatesNestedKeys) {
    Config config;
    config.set("engine.maxConcurrency", 4);
    config.set("custom.section.flag", true);

    EXPECT_EQ(config.get<int>("engine.maxConcurrency"), 4);
    EXPECT_TRUE(config.get<bool>("custom.section.flag"));
    EXPECT_EQ(config.getAll()["custom"]["section"]["flag"], true);
}

TEST(ConfigTest, MergeKeepsUnmentionedKeys) {
    Config config;
    config.merge(json{{"retry", {{"maxAttempts", 9}}}});

    EXPECT_EQ(config.get<int>("retry.maxAttempts"), 9);
    EXPECT_EQ(config.get<int>("retry.maxIntegrityAttempts"), 2);
    EXPECT_EQ(config.get<int>("engine.maxConcurrency"), 16);
}

TEST(ConfigTest, SaveAndLoadRoundTrip) {
    TempDir dir;
    const auto path = (dir.path() / "nested" / "qsde.json").string();

    Config original;
    original.set("network.proxy", std::string("http://proxy:3128"));
    ASSERT_TRUE(original.save(path));

    Config loaded;
    ASSERT_TRUE(loaded.load(path));
    EXPECT_EQ(loaded.get<std::string>("network.proxy"), "http://proxy:3128");

    // A later save without a path reuses the loaded one
    loaded.set("engine.chunkSize", 1024);
    ASSERT_TRUE(loaded.save());
    Config reloaded;
    ASSERT_TRUE(reloaded.load(path));
    EXPECT_EQ(reloaded.get<int>("engine.chunkSize"), 1024);
}

TEST(ConfigTest, PartialFileMergesOverDefaults) {
    TempDir dir;
    writeFile(dir.file("partial.json"), R"({"engine": {"maxConcurrency": 2}})");

    Config config;
    ASSERT_TRUE(config.load(dir.file("partial.json").string()));
    EXPECT_EQ(config.get<int>("engine.maxConcurrency"), 2);
    EXPECT_EQ(config.get<int>("engine.workerThreads"), 32);
}

TEST(ConfigTest, LoadFailuresLeaveValuesUntouched) {
    TempDir dir;
    writeFile(dir.file("broken.json"), "{ not json");

    Config config;
    EXPECT_FALSE(config.load(dir.file("missing.json").string()));
    EXPECT_FALSE(config.load(dir.file("broken.json").string()));
    EXPECT_FALSE(config.save());
    EXPECT_EQ(config.get<int>("engine.maxConcurrency"), 16);
}
