/**
 * VitaFetch - Library setup
 */

#include "vitafetch.hpp"

#include <borealis.hpp>

namespace vitafetch {

bool init(std::shared_ptr<ImageManager> manager, const std::string& settingsPath) {
    brls::Logger::info("VitaFetch {} initializing...", VITA_FETCH_VERSION);

    LoadingSettingsStore& store = LoadingSettingsStore::getInstance();
    bool loaded = store.loadSettings(settingsPath);
    brls::Logger::info("Settings load result: {}", loaded ? "success" : "failed/not found");
    store.applyLogLevel();

    ImageManager::setShared(std::move(manager));
    return loaded;
}

void registerXMLViews() {
    brls::Application::registerXMLView("LoadingImage", LoadingImage::create);
}

bool shutdown(const std::string& settingsPath) {
    ImageManager::setShared(nullptr);
    bool saved = LoadingSettingsStore::getInstance().saveSettings(settingsPath);
    brls::Logger::info("VitaFetch shutting down");
    return saved;
}

} // namespace vitafetch
