/**
 * VitaFetch - Image Task
 * Handle for a single asynchronous image load owned by the loading engine
 */

#pragma once

#include "loading/image_request.hpp"
#include "loading/image_response.hpp"
#include "utils/async.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace vitafetch {

class ImageTask : public std::enable_shared_from_this<ImageTask> {
public:
    enum class State {
        SUSPENDED = 0,
        RUNNING = 1,
        CANCELLED = 2,
        COMPLETED = 3
    };

    using Completion = std::function<void(const std::shared_ptr<ImageTask>&, const ImageResponse&)>;

    // The completion is delivered through the dispatcher exactly once.
    ImageTask(const ImageRequest& request, Completion completion, Dispatcher dispatcher);
    ~ImageTask();

    ImageTask(const ImageTask&) = delete;
    ImageTask& operator=(const ImageTask&) = delete;

    uint64_t getIdentifier() const { return m_identifier; }
    const ImageRequest& getRequest() const { return m_request; }
    State getState() const { return m_state.load(); }
    bool isFinished() const;

    // Delivered response, nullptr until the completion has run (UI thread only)
    const ImageResponse* getResponse() const { return m_response.get(); }

    // SUSPENDED -> RUNNING. Returns false if the task already left SUSPENDED.
    bool markRunning();

    // Finish with the engine's result. Safe to call from any thread; returns
    // false if the task was already completed or cancelled.
    bool complete(const ImageResponse& response);

    // Finish with FAILURE(CANCELLED). Returns false if already finished.
    bool cancel();

    static std::string getStateString(State state);

private:
    bool finish(State finalState, const ImageResponse& response);
    void deliver(const ImageResponse& response);

    uint64_t m_identifier;
    ImageRequest m_request;
    std::atomic<State> m_state{State::SUSPENDED};
    Completion m_completion;
    Dispatcher m_dispatcher;
    std::unique_ptr<ImageResponse> m_response;

    static std::atomic<uint64_t> s_nextIdentifier;
};

using ImageTaskPtr = std::shared_ptr<ImageTask>;

} // namespace vitafetch
