/**
 * VitaFetch - Image Loading View implementation
 */

#include "view/image_loading_view.hpp"

namespace vitafetch {

ImageLoadingView::ImageLoadingView() {
    m_alive = std::make_shared<bool>(true);
}

ImageLoadingView::~ImageLoadingView() {
    if (m_alive) {
        *m_alive = false;
    }
    m_loadingController.reset();
}

ImageViewLoadingController& ImageLoadingView::getImageLoadingController() {
    if (m_loadingController) {
        return *m_loadingController;
    }

    std::weak_ptr<bool> aliveWeak = m_alive;
    m_loadingController = std::make_unique<ImageViewLoadingController>(
        m_imageManager,
        [this, aliveWeak](const ImageTaskPtr& task, const ImageResponse& response,
                          const ImageLoadingOptions& options) {
            auto alive = aliveWeak.lock();
            if (!alive || !*alive) {
                brls::Logger::debug("ImageLoadingView: View destroyed, skipping task {}",
                                    task->getIdentifier());
                return;
            }
            onImageTaskFinished(task, response, options);
        });
    return *m_loadingController;
}

void ImageLoadingView::setImageManager(std::shared_ptr<ImageManager> manager) {
    m_imageManager = manager;
    if (m_loadingController) {
        m_loadingController->setManager(std::move(manager));
    }
}

void ImageLoadingView::cancelLoading() {
    getImageLoadingController().cancelLoading();
}

ImageTaskPtr ImageLoadingView::setImageWith(const std::string& url) {
    return setImageWith(ImageRequest(url));
}

ImageTaskPtr ImageLoadingView::setImageWith(const ImageRequest& request) {
    return setImageWith(request, ImageLoadingOptions());
}

ImageTaskPtr ImageLoadingView::setImageWith(const ImageRequest& request, const ImageLoadingOptions& options) {
    return getImageLoadingController().setImageWith(request, options);
}

ImageTaskPtr ImageLoadingView::getImageTask() const {
    if (!m_loadingController) return nullptr;
    return m_loadingController->getImageTask();
}

void ImageLoadingView::onImageTaskFinished(const ImageTaskPtr& task, const ImageResponse& response,
                                           const ImageLoadingOptions& options) {
    if (options.handler) {
        options.handler(*this, task, response, options);
        return;
    }
    handleDefaultCompletion(task, response, options);
}

} // namespace vitafetch
