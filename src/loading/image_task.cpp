/**
 * VitaFetch - Image Task implementation
 */

#include "loading/image_task.hpp"

namespace vitafetch {

std::atomic<uint64_t> ImageTask::s_nextIdentifier{1};

ImageTask::ImageTask(const ImageRequest& request, Completion completion, Dispatcher dispatcher)
    : m_identifier(s_nextIdentifier.fetch_add(1)),
      m_request(request),
      m_completion(std::move(completion)),
      m_dispatcher(std::move(dispatcher)) {
    if (!m_dispatcher) {
        m_dispatcher = syncOnMain;
    }
}

ImageTask::~ImageTask() = default;

bool ImageTask::isFinished() const {
    State state = m_state.load();
    return state == State::COMPLETED || state == State::CANCELLED;
}

bool ImageTask::markRunning() {
    State expected = State::SUSPENDED;
    return m_state.compare_exchange_strong(expected, State::RUNNING);
}

bool ImageTask::complete(const ImageResponse& response) {
    return finish(State::COMPLETED, response);
}

bool ImageTask::cancel() {
    return finish(State::CANCELLED,
                  ImageResponse::failure(ImageErrorCode::CANCELLED, "Task cancelled"));
}

bool ImageTask::finish(State finalState, const ImageResponse& response) {
    State current = m_state.load();
    do {
        if (current == State::COMPLETED || current == State::CANCELLED) {
            brls::Logger::debug("ImageTask {}: Already {}, ignoring {}", m_identifier,
                                getStateString(current), getStateString(finalState));
            return false;
        }
    } while (!m_state.compare_exchange_weak(current, finalState));

    // Keep the task alive until the deferred delivery has run
    std::shared_ptr<ImageTask> self = shared_from_this();
    m_dispatcher([self, response]() {
        self->deliver(response);
    });
    return true;
}

void ImageTask::deliver(const ImageResponse& response) {
    m_response = std::make_unique<ImageResponse>(response);

    // Release the completion's captures once it has run
    Completion completion = std::move(m_completion);
    m_completion = nullptr;
    if (completion) {
        completion(shared_from_this(), *m_response);
    }
}

std::string ImageTask::getStateString(State state) {
    switch (state) {
        case State::SUSPENDED: return "suspended";
        case State::RUNNING: return "running";
        case State::CANCELLED: return "cancelled";
        case State::COMPLETED: return "completed";
        default: return "unknown";
    }
}

} // namespace vitafetch
