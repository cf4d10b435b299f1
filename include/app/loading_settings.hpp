/**
 * VitaFetch - Image view loading for Borealis applications
 * Loading settings
 */

#pragma once

#include <string>

// Library version
#define VITA_FETCH_VERSION "1.0.0"
#define VITA_FETCH_VERSION_NUM 100

namespace vitafetch {

// Settings shared by every loading view
struct LoadingSettings {
    bool animationsEnabled = true;      // Global switch for the fade-in
    bool cancelSupersededTasks = true;  // Cancel the previous task when a view starts a new one
    bool debugLogging = false;          // Enable debug logging
};

/**
 * Settings singleton - holds and persists LoadingSettings
 */
class LoadingSettingsStore {
public:
    static LoadingSettingsStore& getInstance();

    LoadingSettings& getSettings() { return m_settings; }
    const LoadingSettings& getSettings() const { return m_settings; }

    // Restore defaults without touching the settings file
    void reset();

    // Settings persistence. Missing keys keep their defaults.
    bool loadSettings(const std::string& path = getDefaultPath());
    bool saveSettings(const std::string& path = getDefaultPath()) const;

    // Apply log level based on settings
    void applyLogLevel() const;

    static std::string getDefaultPath();

private:
    LoadingSettingsStore() = default;
    ~LoadingSettingsStore() = default;
    LoadingSettingsStore(const LoadingSettingsStore&) = delete;
    LoadingSettingsStore& operator=(const LoadingSettingsStore&) = delete;

    LoadingSettings m_settings;
};

} // namespace vitafetch
