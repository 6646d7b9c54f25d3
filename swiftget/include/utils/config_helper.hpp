#pragma once

#include <borealis/core/logger.hpp>
#include <borealis/core/singleton.hpp>
#include <nlohmann/json.hpp>

#include <map>
#include <mutex>
#include <string>

#include "core/DownloadSettings.hpp"

enum class SettingItem {
    MAX_CONCURRENT_CHUNKS,
    BUFFER_SIZE,
    TIMEOUT_SECONDS,
    MAX_RETRIES,
    RETRY_DELAY_MS,
    MAX_RETRY_DELAY_MS,
    CONNECTION_LIMIT,
    ENABLE_CONNECTION_POOLING,
    ENABLE_COMPRESSION,
    MAX_CONCURRENT_JOBS,
    MAX_JOB_RETRIES,
    CHUNK_THRESHOLD_BYTES,
    DOWNLOAD_DIRECTORY,
};

/**
 * settings.json in the per-user config directory.
 * Reading never fails: a missing or broken file leaves the built-in defaults.
 */
class ProgramConfig : public brls::Singleton<ProgramConfig> {
public:
    ProgramConfig();

    // Resolves the config directory (unless already set) and loads settings.json.
    void init();
    void load();
    bool save() const;

    std::string getConfigDir() const;
    void setConfigDir(const std::string& dir);
    std::string getSettingsPath() const;

    template <typename T>
    T getSettingItem(SettingItem item, const T& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string& key = SETTING_KEYS.at(item);
        if (!setting_.contains(key)) return defaultValue;
        try {
            return setting_.at(key).get<T>();
        } catch (const nlohmann::json::exception& e) {
            brls::Logger::warning("ProgramConfig: Bad value for {}: {}", key, e.what());
            return defaultValue;
        }
    }

    template <typename T>
    void setSettingItem(SettingItem item, const T& value, bool autoSave = true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            setting_[SETTING_KEYS.at(item)] = value;
        }
        if (autoSave) save();
    }

    // Snapshot of the current download tunables, normalized.
    swiftget::DownloadSettings downloadSettings() const;
    void setDownloadSettings(const swiftget::DownloadSettings& settings, bool autoSave = true);

    static std::string defaultConfigDir();
    static std::string defaultDownloadDir();

private:
    inline static const std::map<SettingItem, std::string> SETTING_KEYS = {
        {SettingItem::MAX_CONCURRENT_CHUNKS, "maxConcurrentChunks"},
        {SettingItem::BUFFER_SIZE, "bufferSize"},
        {SettingItem::TIMEOUT_SECONDS, "timeoutSeconds"},
        {SettingItem::MAX_RETRIES, "maxRetries"},
        {SettingItem::RETRY_DELAY_MS, "retryDelayMs"},
        {SettingItem::MAX_RETRY_DELAY_MS, "maxRetryDelayMs"},
        {SettingItem::CONNECTION_LIMIT, "connectionLimit"},
        {SettingItem::ENABLE_CONNECTION_POOLING, "enableConnectionPooling"},
        {SettingItem::ENABLE_COMPRESSION, "enableCompression"},
        {SettingItem::MAX_CONCURRENT_JOBS, "maxConcurrentJobs"},
        {SettingItem::MAX_JOB_RETRIES, "maxJobRetries"},
        {SettingItem::CHUNK_THRESHOLD_BYTES, "chunkThresholdBytes"},
        {SettingItem::DOWNLOAD_DIRECTORY, "downloadDirectory"},
    };

    mutable std::mutex mutex_;
    nlohmann::json setting_ = nlohmann::json::object();
    std::string configDir_;
};
