/**
 * VitaFetch - Image view loading for Borealis applications
 *
 * Umbrella header and library setup
 */

#pragma once

#include <memory>
#include <string>

#include "app/loading_settings.hpp"
#include "loading/image_manager.hpp"
#include "loading/image_loading_options.hpp"
#include "loading/image_request.hpp"
#include "loading/image_response.hpp"
#include "loading/image_task.hpp"
#include "loading/image_view_loading_controller.hpp"
#include "view/image_completion_policy.hpp"
#include "view/image_displaying_view.hpp"
#include "view/image_loading_view.hpp"
#include "view/loading_image.hpp"

namespace vitafetch {

/**
 * Load settings, apply the log level and install the shared engine.
 * Call once after brls::Application::init().
 *
 * @param manager Engine used by views without their own manager (may be null)
 * @param settingsPath Settings file, defaults to the platform location
 * @return false if the settings file could not be read (defaults are used)
 */
bool init(std::shared_ptr<ImageManager> manager,
          const std::string& settingsPath = LoadingSettingsStore::getDefaultPath());

// Register LoadingImage for use in XML layouts
void registerXMLViews();

// Drop the shared engine and persist settings
bool shutdown(const std::string& settingsPath = LoadingSettingsStore::getDefaultPath());

} // namespace vitafetch
