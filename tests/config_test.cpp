#include <gtest/gtest.h>
#include "core/poco_config_manager.hpp"
#include "core/analysis_pipeline.hpp"
#include "test_base.hpp"

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().resetToDefaults();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().resetToDefaults();
        TestBase::TearDown();
    }
};

TEST_F(PocoConfigManagerTest, DefaultsAreValid)
{
    auto &config = PocoConfigManager::getInstance();

    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_EQ(config.getPathLayout(), "filename");
    EXPECT_EQ(config.getRecordIdColumn(), "ID");
    EXPECT_EQ(config.getAccessionColumn(), "CODE");
    EXPECT_EQ(config.getInventoryColumn(), "NUMMER");
    EXPECT_EQ(config.getSuffixColumn(), "CODE_1");
    EXPECT_EQ(config.getUnlinkedMarkers(), (std::vector<std::string>{"_OGK", "_OGKB"}));
    EXPECT_FALSE(config.getIncludeAverageHash());
    EXPECT_EQ(config.getMetadataSource(), "decoder");
    EXPECT_EQ(config.getMaxHashingThreads(), 4);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadFromFile)
{
    std::string path = writeFile("config.json", R"({
        "log_level": "DEBUG",
        "scan": {"root": "/archive", "image_extensions": "JPG, .tif"},
        "linkage": {"path_layout": "directory"},
        "similarity": {"include_average_hash": true},
        "threading": {"max_hashing_threads": 8}
    })");

    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(path));

    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(config.getScanRoot(), "/archive");
    EXPECT_EQ(config.getImageExtensions(), (std::vector<std::string>{"jpg", "tif"}));
    EXPECT_EQ(config.getPathLayout(), "directory");
    EXPECT_TRUE(config.getIncludeAverageHash());
    EXPECT_EQ(config.getMaxHashingThreads(), 8);
    // Keys absent from the file fall back to defaults
    EXPECT_EQ(config.getDatabasePath(), "archive_dedup.db");
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadRejectsMissingAndMalformedFiles)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load(getTestDir() + "/missing.json"));

    std::string path = writeFile("broken.json", "{ not json");
    EXPECT_FALSE(config.load(path));
    EXPECT_EQ(config.getLogLevel(), "INFO");
}

TEST_F(PocoConfigManagerTest, UpdateFlattensNestedKeys)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"records", {{"path", "/data/records.csv"}, {"columns", {{"id", "RecordNo"}}}}},
                   {"threading", {{"max_hashing_threads", 2}}}});

    EXPECT_EQ(config.getRecordsPath(), "/data/records.csv");
    EXPECT_EQ(config.getRecordIdColumn(), "RecordNo");
    EXPECT_EQ(config.getMaxHashingThreads(), 2);

    auto all = config.getAll();
    EXPECT_EQ(all["records"]["path"], "/data/records.csv");
}

TEST_F(PocoConfigManagerTest, ValidationCatchesBadValues)
{
    auto &config = PocoConfigManager::getInstance();

    config.update({{"linkage", {{"path_layout", "sideways"}}}});
    EXPECT_FALSE(config.validateConfig());
    config.resetToDefaults();

    config.update({{"linkage", {{"filename_pattern", "([A-Z]+"}}}});
    EXPECT_FALSE(config.validateConfig());
    config.resetToDefaults();

    config.update({{"metadata", {{"source", "guess"}}}});
    EXPECT_FALSE(config.validateConfig());
    config.resetToDefaults();

    config.update({{"threading", {{"max_hashing_threads", 0}}}});
    EXPECT_FALSE(config.validateConfig());
    config.resetToDefaults();

    config.update({{"log_level", "LOUD"}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, SaveAndReload)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"output", {{"directory", "/tmp/reports"}}}});

    std::string path = getTestDir() + "/saved.json";
    ASSERT_TRUE(config.save(path));

    config.resetToDefaults();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getOutputDirectory(), "/tmp/reports");
}

TEST_F(PocoConfigManagerTest, PipelineOptionsFromConfig)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"linkage", {{"path_layout", "directory"}, {"unlinked_markers", "_X, _Y"}}},
                   {"scan", {{"root", "/archive"}}}});

    PipelineOptions options = PipelineOptions::fromConfig(config);
    EXPECT_EQ(options.path_layout, PathLayout::DIRECTORY);
    EXPECT_EQ(options.scan_root, "/archive");
    EXPECT_EQ(options.unlinked_markers, (std::vector<std::string>{"_X", "_Y"}));
    EXPECT_EQ(options.columns.inventory, "NUMMER");
}

TEST(SplitTest, TrimsAndDropsEmptyTokens)
{
    EXPECT_EQ(split(" a, b ,,c ", ','), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split("", ',').empty());
}
