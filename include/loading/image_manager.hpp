/**
 * VitaFetch - Image Manager
 * Seam to the image loading engine that does the actual fetch/decode/cache work
 */

#pragma once

#include "loading/image_task.hpp"
#include "utils/async.hpp"

#include <memory>
#include <mutex>

namespace vitafetch {

/**
 * Base class for loading engines.
 *
 * startLoad() creates the task and hands it to resumeTask(). The engine does
 * its work on whatever threads it likes and finishes by calling
 * ImageTask::complete(); the completion is then redelivered through the
 * manager's dispatcher (the borealis UI thread by default).
 */
class ImageManager {
public:
    ImageManager();
    virtual ~ImageManager();

    ImageManager(const ImageManager&) = delete;
    ImageManager& operator=(const ImageManager&) = delete;

    // Begin an asynchronous load. Never blocks.
    ImageTaskPtr startLoad(const ImageRequest& request, ImageTask::Completion completion);

    // Two-step form of startLoad() for callers that must record the task
    // before the engine can possibly complete it.
    ImageTaskPtr makeTask(const ImageRequest& request, ImageTask::Completion completion);
    void resume(const ImageTaskPtr& task);

    // Best-effort cancellation; the task completes with FAILURE(CANCELLED)
    void cancel(const ImageTaskPtr& task);

    void setDispatcher(Dispatcher dispatcher) { m_dispatcher = std::move(dispatcher); }
    const Dispatcher& getDispatcher() const { return m_dispatcher; }

    // Process-wide manager used by views that were not given one
    static std::shared_ptr<ImageManager> getShared();
    static void setShared(std::shared_ptr<ImageManager> manager);

protected:
    // Start the engine work for a task already marked RUNNING
    virtual void resumeTask(const ImageTaskPtr& task) = 0;

    // Stop engine work for a cancelled task
    virtual void cancelTask(const ImageTaskPtr& task) {}

private:
    Dispatcher m_dispatcher;

    static std::shared_ptr<ImageManager> s_shared;
    static std::mutex s_sharedMutex;
};

} // namespace vitafetch
