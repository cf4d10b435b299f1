/**
 * VitaFetch - Image View Loading Controller implementation
 */

#include "loading/image_view_loading_controller.hpp"
#include "app/loading_settings.hpp"

namespace vitafetch {

ImageViewLoadingController::ImageViewLoadingController(std::shared_ptr<ImageManager> manager, Handler handler)
    : m_manager(std::move(manager)), m_handler(std::move(handler)) {
    m_alive = std::make_shared<bool>(true);
}

ImageViewLoadingController::~ImageViewLoadingController() {
    // Mark as no longer alive before cancelling so the cancellation
    // delivery cannot reach the owning view
    *m_alive = false;
    cancelLoading();
}

std::shared_ptr<ImageManager> ImageViewLoadingController::getManager() const {
    if (m_manager) return m_manager;
    return ImageManager::getShared();
}

void ImageViewLoadingController::cancelLoading() {
    if (!m_task) return;

    // Drop the reference first: the cancellation delivery must already see
    // the task as stale
    ImageTaskPtr task;
    task.swap(m_task);

    std::shared_ptr<ImageManager> manager = getManager();
    if (manager) {
        manager->cancel(task);
    } else {
        task->cancel();
    }
}

ImageTaskPtr ImageViewLoadingController::setImageWith(const ImageRequest& request,
                                                      const ImageLoadingOptions& options) {
    if (LoadingSettingsStore::getInstance().getSettings().cancelSupersededTasks) {
        cancelLoading();
    } else {
        // Superseded task keeps running; its completion is ignored as stale
        m_task.reset();
    }

    std::weak_ptr<bool> aliveWeak = m_alive;
    ImageTask::Completion completion = [this, aliveWeak, options](const ImageTaskPtr& task,
                                                                  const ImageResponse& response) {
        auto alive = aliveWeak.lock();
        if (!alive || !*alive) {
            brls::Logger::debug("ImageViewLoadingController: Controller destroyed, dropping task {}",
                                task->getIdentifier());
            return;
        }
        onTaskFinished(task, response, options);
    };

    std::shared_ptr<ImageManager> manager = getManager();
    if (!manager) {
        brls::Logger::error("ImageViewLoadingController: No image manager installed, cannot load {}",
                            request.url);
        ImageTaskPtr task = std::make_shared<ImageTask>(request, completion, runInline);
        m_task = task;
        task->complete(ImageResponse::failure(ImageErrorCode::NO_MANAGER));
        return task;
    }

    // Record the task before resuming it; an engine may complete synchronously
    ImageTaskPtr task = manager->makeTask(request, completion);
    m_task = task;
    manager->resume(task);
    return task;
}

void ImageViewLoadingController::onTaskFinished(const ImageTaskPtr& task, const ImageResponse& response,
                                                const ImageLoadingOptions& options) {
    if (task != m_task) {
        brls::Logger::debug("ImageViewLoadingController: Ignoring stale task {} ({})",
                            task->getIdentifier(), ImageTask::getStateString(task->getState()));
        return;
    }

    if (!response.isSuccess()) {
        brls::Logger::debug("ImageViewLoadingController: Task {} failed: {}", task->getIdentifier(),
                            response.getError().message);
    }

    if (m_handler) {
        m_handler(task, response, options);
    }
}

} // namespace vitafetch
