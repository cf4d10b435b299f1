/**
 * VitaFetch - Loading settings implementation
 */

#include "app/loading_settings.hpp"

#include <borealis.hpp>
#include <fstream>
#include <sstream>

namespace vitafetch {

#ifdef __vita__
static const char* SETTINGS_PATH = "ux0:data/VitaFetch/settings.json";
#else
static const char* SETTINGS_PATH = "vitafetch_settings.json";
#endif

LoadingSettingsStore& LoadingSettingsStore::getInstance() {
    static LoadingSettingsStore instance;
    return instance;
}

std::string LoadingSettingsStore::getDefaultPath() {
    return SETTINGS_PATH;
}

void LoadingSettingsStore::reset() {
    m_settings = LoadingSettings();
}

void LoadingSettingsStore::applyLogLevel() const {
    if (m_settings.debugLogging) {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_DEBUG);
        brls::Logger::info("Debug logging enabled");
    } else {
        brls::Logger::setLogLevel(brls::LogLevel::LOG_INFO);
        brls::Logger::info("Debug logging disabled");
    }
}

bool LoadingSettingsStore::loadSettings(const std::string& path) {
    brls::Logger::debug("loadSettings: Opening {}", path);

    std::ifstream file(path);
    if (!file.is_open()) {
        brls::Logger::debug("No settings file found at {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string content = buffer.str();

    if (content.empty() || content.size() > 16384) {
        brls::Logger::error("loadSettings: Invalid file size {}", content.size());
        return false;
    }

    // Simple JSON parsing for booleans (handles whitespace after colon)
    auto extractBool = [&content](const std::string& key, bool defaultVal) -> bool {
        std::string search = "\"" + key + "\":";
        size_t pos = content.find(search);
        if (pos == std::string::npos) return defaultVal;
        pos += search.length();
        while (pos < content.length() && (content[pos] == ' ' || content[pos] == '\t')) pos++;
        if (content.compare(pos, 4, "true") == 0) return true;
        if (content.compare(pos, 5, "false") == 0) return false;
        return defaultVal;
    };

    LoadingSettings defaults;
    m_settings.animationsEnabled = extractBool("animationsEnabled", defaults.animationsEnabled);
    m_settings.cancelSupersededTasks = extractBool("cancelSupersededTasks", defaults.cancelSupersededTasks);
    m_settings.debugLogging = extractBool("debugLogging", defaults.debugLogging);

    brls::Logger::info("Settings loaded: animationsEnabled={}, cancelSupersededTasks={}, debugLogging={}",
                       m_settings.animationsEnabled, m_settings.cancelSupersededTasks,
                       m_settings.debugLogging);
    return true;
}

bool LoadingSettingsStore::saveSettings(const std::string& path) const {
    brls::Logger::info("saveSettings: Saving to {}", path);

    std::string json = "{\n";
    json += "  \"animationsEnabled\": " + std::string(m_settings.animationsEnabled ? "true" : "false") + ",\n";
    json += "  \"cancelSupersededTasks\": " + std::string(m_settings.cancelSupersededTasks ? "true" : "false") + ",\n";
    json += "  \"debugLogging\": " + std::string(m_settings.debugLogging ? "true" : "false") + "\n";
    json += "}\n";

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        brls::Logger::error("Failed to open settings file for writing: {}", path);
        return false;
    }

    file << json;
    file.close();

    if (!file) {
        brls::Logger::error("Failed to write settings to {}", path);
        return false;
    }

    brls::Logger::info("Settings saved successfully ({} bytes)", json.length());
    return true;
}

} // namespace vitafetch
