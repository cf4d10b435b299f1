/**
 * VitaFetch - Image View Loading Controller
 * Tracks the current image task of one view and forwards its completion
 */

#pragma once

#include "loading/image_loading_options.hpp"
#include "loading/image_manager.hpp"
#include "loading/image_request.hpp"
#include "loading/image_task.hpp"

#include <functional>
#include <memory>

namespace vitafetch {

/**
 * One controller exists per view. Starting a new load supersedes the
 * previous one: only the completion of the current task reaches the handler,
 * so a slow stale load never overwrites a recycled view.
 *
 * All methods must be called on the UI thread.
 */
class ImageViewLoadingController {
public:
    using Handler = std::function<void(const ImageTaskPtr&, const ImageResponse&, const ImageLoadingOptions&)>;

    // A null manager means ImageManager::getShared() at load time
    ImageViewLoadingController(std::shared_ptr<ImageManager> manager, Handler handler);
    ~ImageViewLoadingController();

    ImageViewLoadingController(const ImageViewLoadingController&) = delete;
    ImageViewLoadingController& operator=(const ImageViewLoadingController&) = delete;

    // Cancels the current task, if any
    void cancelLoading();

    // Starts loading the request and makes the new task current
    ImageTaskPtr setImageWith(const ImageRequest& request, const ImageLoadingOptions& options);

    const ImageTaskPtr& getImageTask() const { return m_task; }

    void setManager(std::shared_ptr<ImageManager> manager) { m_manager = std::move(manager); }
    std::shared_ptr<ImageManager> getManager() const;

private:
    void onTaskFinished(const ImageTaskPtr& task, const ImageResponse& response,
                        const ImageLoadingOptions& options);

    std::shared_ptr<ImageManager> m_manager;
    Handler m_handler;
    ImageTaskPtr m_task;

    // Set to false in the destructor; deferred completions hold a weak copy
    std::shared_ptr<bool> m_alive;
};

} // namespace vitafetch
