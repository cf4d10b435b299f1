/**
 * VitaFetch - Image Completion Policy implementation
 */

#include "view/image_completion_policy.hpp"
#include "app/loading_settings.hpp"

#include <borealis.hpp>

namespace vitafetch {

void ImageCompletionPolicy::handle(ImageDisplayingView& view, const ImageTaskPtr& task,
                                   const ImageResponse& response, const ImageLoadingOptions& options) {
    if (!response.isSuccess()) {
        return;
    }

    view.displayImage(response.getImage());

    // Nothing to mask when the image arrived without latency
    if (!options.animated || response.getInfo().isFastResponse) {
        return;
    }
    if (!LoadingSettingsStore::getInstance().getSettings().animationsEnabled) {
        return;
    }

    if (options.animations) {
        options.animations(view);
        return;
    }

    brls::Logger::debug("ImageCompletionPolicy: Fading in task {}", task ? task->getIdentifier() : 0);
    view.addAnimation(TRANSITION_KEY, makeFadeAnimation());
}

LayerAnimation ImageCompletionPolicy::makeFadeAnimation() {
    LayerAnimation animation;
    animation.property = "opacity";
    animation.fromValue = 0.0f;
    animation.toValue = 1.0f;
    animation.duration = FADE_DURATION;
    return animation;
}

std::shared_ptr<ImageCompletionPolicy> ImageCompletionPolicy::getDefault() {
    static std::shared_ptr<ImageCompletionPolicy> policy = std::make_shared<ImageCompletionPolicy>();
    return policy;
}

} // namespace vitafetch
