/**
 * VitaFetch - Image Displaying View implementation
 */

#include "view/image_displaying_view.hpp"
#include "view/image_completion_policy.hpp"

namespace vitafetch {

ImageDisplayingView::ImageDisplayingView() = default;

ImageDisplayingView::~ImageDisplayingView() = default;

void ImageDisplayingView::setCompletionPolicy(std::shared_ptr<ImageCompletionPolicy> policy) {
    m_completionPolicy = std::move(policy);
}

ImageCompletionPolicy& ImageDisplayingView::getCompletionPolicy() {
    if (!m_completionPolicy) {
        m_completionPolicy = ImageCompletionPolicy::getDefault();
    }
    return *m_completionPolicy;
}

void ImageDisplayingView::handleDefaultCompletion(const ImageTaskPtr& task, const ImageResponse& response,
                                                  const ImageLoadingOptions& options) {
    // Hold our own reference: the policy may replace itself on this view
    std::shared_ptr<ImageCompletionPolicy> policy =
        m_completionPolicy ? m_completionPolicy : ImageCompletionPolicy::getDefault();
    policy->handle(*this, task, response, options);
}

} // namespace vitafetch
