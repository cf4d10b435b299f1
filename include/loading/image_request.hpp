/**
 * VitaFetch - Image Request
 * Describes what the loading engine should fetch for a view
 */

#pragma once

#include <string>
#include <map>

namespace vitafetch {

// How the engine may use its memory cache for a request
enum class MemoryCachePolicy {
    RETURN_CACHED_ELSE_LOAD = 0,  // Serve from memory cache when possible
    RELOAD_IGNORING_CACHE = 1     // Always go through the full load path
};

struct ImageRequest {
    std::string url;

    // Requested size in pixels, 0 keeps the original size
    int targetWidth = 0;
    int targetHeight = 0;

    MemoryCachePolicy memoryCachePolicy = MemoryCachePolicy::RETURN_CACHED_ELSE_LOAD;

    // Passed through to the engine untouched
    std::map<std::string, std::string> userInfo;

    ImageRequest() = default;
    explicit ImageRequest(const std::string& url) : url(url) {}
    ImageRequest(const std::string& url, int width, int height)
        : url(url), targetWidth(width), targetHeight(height) {}
};

} // namespace vitafetch
