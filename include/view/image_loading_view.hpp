/**
 * VitaFetch - Image Loading View
 * Capability for views that load images through their own loading controller
 */

#pragma once

#include "loading/image_loading_options.hpp"
#include "loading/image_manager.hpp"
#include "loading/image_request.hpp"
#include "loading/image_view_loading_controller.hpp"

#include <memory>
#include <string>

namespace vitafetch {

/**
 * Mix into a view class to give it setImageWith()/cancelLoading().
 *
 * The view owns exactly one ImageViewLoadingController, created on first use
 * and destroyed with the view. The controller only reaches back into the view
 * through an alive flag, so late completions after destruction are dropped.
 */
class ImageLoadingView {
public:
    ImageLoadingView();
    virtual ~ImageLoadingView();

    ImageLoadingView(const ImageLoadingView&) = delete;
    ImageLoadingView& operator=(const ImageLoadingView&) = delete;

    // Cancels the task currently associated with the view
    void cancelLoading();

    // Loads and displays an image. Cancels previously started requests.
    ImageTaskPtr setImageWith(const std::string& url);
    ImageTaskPtr setImageWith(const ImageRequest& request);
    ImageTaskPtr setImageWith(const ImageRequest& request, const ImageLoadingOptions& options);

    // Current task, or nullptr
    ImageTaskPtr getImageTask() const;

    ImageViewLoadingController& getImageLoadingController();

    // Engine for this view; nullptr falls back to ImageManager::getShared()
    void setImageManager(std::shared_ptr<ImageManager> manager);

    // Called when the task currently associated with the view completes.
    // Runs options.handler if set, otherwise handleDefaultCompletion().
    virtual void onImageTaskFinished(const ImageTaskPtr& task, const ImageResponse& response,
                                     const ImageLoadingOptions& options);

protected:
    virtual void handleDefaultCompletion(const ImageTaskPtr& task, const ImageResponse& response,
                                         const ImageLoadingOptions& options) {}

private:
    std::shared_ptr<ImageManager> m_imageManager;
    std::unique_ptr<ImageViewLoadingController> m_loadingController;

    // Alive flag - set to false in destructor to prevent use-after-free
    // in deferred completion callbacks
    std::shared_ptr<bool> m_alive;
};

} // namespace vitafetch
