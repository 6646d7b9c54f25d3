#include <gtest/gtest.h>

#include "core/DownloadSettings.hpp"
#include "core/FileStore.hpp"
#include "test_helpers.hpp"
#include "utils/config_helper.hpp"

using namespace swiftget;

TEST(DownloadSettingsTest, MissingKeysKeepDefaults) {
    DownloadSettings settings;
    from_json(nlohmann::json{{"maxRetries", 7}, {"downloadDirectory", "/data"}}, settings);
    EXPECT_EQ(settings.maxRetries, 7);
    EXPECT_EQ(settings.downloadDirectory, "/data");
    EXPECT_EQ(settings.maxConcurrentChunks, 8);
    EXPECT_EQ(settings.bufferSize, 8192);
    EXPECT_EQ(settings.timeoutSeconds, 180);
    EXPECT_EQ(settings.retryDelayMs, 1000);
    EXPECT_EQ(settings.maxRetryDelayMs, 16000);
    EXPECT_TRUE(settings.enableConnectionPooling);
    EXPECT_EQ(settings.maxConcurrentJobs, 3);
}

TEST(DownloadSettingsTest, NormalizedClampsNonsense) {
    DownloadSettings settings;
    settings.maxConcurrentChunks = 0;
    settings.bufferSize          = 1;
    settings.timeoutSeconds      = -5;
    settings.maxRetries          = -1;
    settings.retryDelayMs        = 2000;
    settings.maxRetryDelayMs     = 100;
    settings.maxConcurrentJobs   = 0;

    auto normalized = settings.normalized();
    EXPECT_EQ(normalized.maxConcurrentChunks, 1);
    EXPECT_EQ(normalized.bufferSize, 1024);
    EXPECT_EQ(normalized.timeoutSeconds, 1);
    EXPECT_EQ(normalized.maxRetries, 0);
    EXPECT_EQ(normalized.maxRetryDelayMs, 2000);
    EXPECT_EQ(normalized.maxConcurrentJobs, 1);
}

TEST(DownloadSettingsTest, JsonRoundTripKeepsEveryField) {
    DownloadSettings settings;
    settings.maxConcurrentChunks     = 4;
    settings.enableCompression       = false;
    settings.chunkThresholdBytes     = 5000000000ull;
    settings.downloadDirectory       = "/srv/downloads";

    nlohmann::json j;
    to_json(j, settings);
    DownloadSettings loaded;
    from_json(j, loaded);
    EXPECT_EQ(loaded.maxConcurrentChunks, 4);
    EXPECT_FALSE(loaded.enableCompression);
    EXPECT_EQ(loaded.chunkThresholdBytes, 5000000000ull);
    EXPECT_EQ(loaded.downloadDirectory, "/srv/downloads");
}

class ProgramConfigTest : public ::testing::Test {
protected:
    test::TempDir dir;
    ProgramConfig config;

    void SetUp() override { config.setConfigDir(dir.path()); }
};

TEST_F(ProgramConfigTest, MissingFileUsesDefaults) {
    config.init();
    auto settings = config.downloadSettings();
    EXPECT_EQ(settings.maxRetries, 5);
    EXPECT_EQ(settings.maxConcurrentChunks, 8);
    EXPECT_FALSE(settings.downloadDirectory.empty());
    EXPECT_EQ(config.getSettingItem<int>(SettingItem::MAX_CONCURRENT_JOBS, 3), 3);
}

TEST_F(ProgramConfigTest, CorruptFileUsesDefaults) {
    test::writeFile(config.getSettingsPath(), "{ not json");
    config.init();
    EXPECT_EQ(config.downloadSettings().maxRetries, 5);

    test::writeFile(config.getSettingsPath(), "[1, 2, 3]");
    config.load();
    EXPECT_EQ(config.downloadSettings().timeoutSeconds, 180);
}

TEST_F(ProgramConfigTest, SettingsSurviveReload) {
    config.init();
    config.setSettingItem(SettingItem::MAX_CONCURRENT_CHUNKS, 12);
    config.setSettingItem(SettingItem::DOWNLOAD_DIRECTORY, std::string("/tmp/swiftget-out"));
    ASSERT_TRUE(FileStore::exists(config.getSettingsPath()));

    ProgramConfig reloaded;
    reloaded.setConfigDir(dir.path());
    reloaded.init();
    EXPECT_EQ(reloaded.getSettingItem<int>(SettingItem::MAX_CONCURRENT_CHUNKS, 8), 12);
    auto settings = reloaded.downloadSettings();
    EXPECT_EQ(settings.maxConcurrentChunks, 12);
    EXPECT_EQ(settings.downloadDirectory, "/tmp/swiftget-out");
}

TEST_F(ProgramConfigTest, WrongTypeFallsBackToDefault) {
    test::writeFile(config.getSettingsPath(), R"({"maxRetries": "many", "bufferSize": 4096})");
    config.init();
    EXPECT_EQ(config.getSettingItem<int>(SettingItem::MAX_RETRIES, 5), 5);
    EXPECT_EQ(config.getSettingItem<int>(SettingItem::BUFFER_SIZE, 8192), 4096);
    // A bad field spoils the whole snapshot, never the process.
    EXPECT_EQ(config.downloadSettings().maxRetries, 5);
}

TEST_F(ProgramConfigTest, DownloadSettingsWriteThrough) {
    config.init();
    DownloadSettings settings = config.downloadSettings();
    settings.maxConcurrentJobs = 5;
    config.setDownloadSettings(settings);

    ProgramConfig reloaded;
    reloaded.setConfigDir(dir.path());
    reloaded.init();
    EXPECT_EQ(reloaded.downloadSettings().maxConcurrentJobs, 5);
}
