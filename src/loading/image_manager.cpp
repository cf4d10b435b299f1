/**
 * VitaFetch - Image Manager implementation
 */

#include "loading/image_manager.hpp"

namespace vitafetch {

std::shared_ptr<ImageManager> ImageManager::s_shared;
std::mutex ImageManager::s_sharedMutex;

ImageManager::ImageManager() : m_dispatcher(syncOnMain) {}

ImageManager::~ImageManager() = default;

ImageTaskPtr ImageManager::startLoad(const ImageRequest& request, ImageTask::Completion completion) {
    ImageTaskPtr task = makeTask(request, std::move(completion));
    resume(task);
    return task;
}

ImageTaskPtr ImageManager::makeTask(const ImageRequest& request, ImageTask::Completion completion) {
    return std::make_shared<ImageTask>(request, std::move(completion), m_dispatcher);
}

void ImageManager::resume(const ImageTaskPtr& task) {
    if (!task || !task->markRunning()) return;

    brls::Logger::debug("ImageManager: Starting task {} for {}", task->getIdentifier(),
                        task->getRequest().url);
    resumeTask(task);
}

void ImageManager::cancel(const ImageTaskPtr& task) {
    if (!task) return;

    if (task->cancel()) {
        brls::Logger::debug("ImageManager: Cancelled task {}", task->getIdentifier());
        cancelTask(task);
    }
}

std::shared_ptr<ImageManager> ImageManager::getShared() {
    std::lock_guard<std::mutex> lock(s_sharedMutex);
    return s_shared;
}

void ImageManager::setShared(std::shared_ptr<ImageManager> manager) {
    std::lock_guard<std::mutex> lock(s_sharedMutex);
    s_shared = std::move(manager);
    brls::Logger::info("ImageManager: Shared manager {}", s_shared ? "installed" : "cleared");
}

} // namespace vitafetch
