/**
 * VitaFetch - Image Completion Policy
 * Default handling of a finished task: display, then maybe fade in
 */

#pragma once

#include "loading/image_loading_options.hpp"
#include "loading/image_response.hpp"
#include "loading/image_task.hpp"
#include "view/image_displaying_view.hpp"

#include <memory>

namespace vitafetch {

class ImageCompletionPolicy {
public:
    // Key of the default fade so a new fade replaces one still running
    static constexpr const char* TRANSITION_KEY = "imageTransition";
    static constexpr float FADE_DURATION = 0.25f;

    virtual ~ImageCompletionPolicy() = default;

    // Failures change nothing. Successes are displayed, then animated unless
    // disabled or served from a fast path.
    virtual void handle(ImageDisplayingView& view, const ImageTaskPtr& task,
                        const ImageResponse& response, const ImageLoadingOptions& options);

    static LayerAnimation makeFadeAnimation();

    static std::shared_ptr<ImageCompletionPolicy> getDefault();
};

} // namespace vitafetch
