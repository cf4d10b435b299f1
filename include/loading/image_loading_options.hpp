/**
 * VitaFetch - Image Loading Options
 */

#pragma once

#include "loading/image_response.hpp"
#include "loading/image_task.hpp"

#include <any>
#include <functional>

namespace vitafetch {

class ImageLoadingView;
struct ImageLoadingOptions;

using ImageAnimations = std::function<void(ImageLoadingView&)>;
using ImageCompletionHandler = std::function<void(ImageLoadingView&, const ImageTaskPtr&,
                                                  const ImageResponse&, const ImageLoadingOptions&)>;

struct ImageLoadingOptions {
    // Custom animations run when the image is displayed. Not called for fast
    // responses or when animated is false. Replaces the default fade.
    ImageAnimations animations;

    // If true the loaded image is displayed with an animation
    bool animated = true;

    // Replaces the default completion handling entirely
    ImageCompletionHandler handler;

    // Opaque, never read by the library
    std::any userInfo;
};

} // namespace vitafetch
