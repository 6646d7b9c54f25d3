#include "utils/config_helper.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

ProgramConfig::ProgramConfig() = default;

std::string ProgramConfig::defaultConfigDir() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return (fs::path(xdg) / "swiftget").string();
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / ".config" / "swiftget").string();
    }
    return (fs::current_path() / ".swiftget").string();
}

std::string ProgramConfig::defaultDownloadDir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return (fs::path(home) / "Downloads" / "SwiftGet").string();
    }
    return (fs::current_path() / "downloads").string();
}

void ProgramConfig::init() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (configDir_.empty()) configDir_ = defaultConfigDir();
    }
    brls::Logger::info("ProgramConfig: Config dir {}", getConfigDir());
    load();
}

void ProgramConfig::load() {
    const std::string path = getSettingsPath();
    std::ifstream in(path);
    if (!in) {
        brls::Logger::info("ProgramConfig: No settings at {}, using defaults", path);
        return;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(in);
        if (!j.is_object()) {
            brls::Logger::warning("ProgramConfig: {} is not a json object, using defaults", path);
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        setting_ = std::move(j);
    } catch (const nlohmann::json::exception& e) {
        brls::Logger::warning("ProgramConfig: Cannot parse {}: {}, using defaults", path, e.what());
        return;
    }
    brls::Logger::info("ProgramConfig: Loaded {}", path);
}

bool ProgramConfig::save() const {
    const std::string path = getSettingsPath();
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        brls::Logger::warning("ProgramConfig: Cannot create {}: {}", getConfigDir(), ec.message());
        return false;
    }

    std::string content;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        content = setting_.dump(2);
    }
    std::ofstream out(path, std::ios::trunc);
    if (!(out << content)) {
        brls::Logger::warning("ProgramConfig: Cannot write {}", path);
        return false;
    }
    brls::Logger::debug("ProgramConfig: Saved {}", path);
    return true;
}

std::string ProgramConfig::getConfigDir() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configDir_.empty() ? defaultConfigDir() : configDir_;
}

void ProgramConfig::setConfigDir(const std::string& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    configDir_ = dir;
}

std::string ProgramConfig::getSettingsPath() const { return (fs::path(getConfigDir()) / "settings.json").string(); }

swiftget::DownloadSettings ProgramConfig::downloadSettings() const {
    swiftget::DownloadSettings settings;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            swiftget::from_json(setting_, settings);
        } catch (const nlohmann::json::exception& e) {
            brls::Logger::warning("ProgramConfig: Invalid download settings: {}, using defaults", e.what());
            settings = swiftget::DownloadSettings{};
        }
    }
    if (settings.downloadDirectory.empty()) settings.downloadDirectory = defaultDownloadDir();
    return settings.normalized();
}

void ProgramConfig::setDownloadSettings(const swiftget::DownloadSettings& settings, bool autoSave) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        nlohmann::json j;
        swiftget::to_json(j, settings);
        setting_.update(j);
    }
    if (autoSave) save();
}
