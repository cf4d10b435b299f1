/**
 * VitaFetch - Loading controller and view binding tests
 */

#include <gtest/gtest.h>

#include "loading/image_view_loading_controller.hpp"
#include "view/image_loading_view.hpp"
#include "test_helpers.hpp"

#include <memory>

namespace vitafetch {
namespace test {

class ImageViewLoadingControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager = std::make_shared<FakeImageManager>();
        view.reset(new FakeDisplayView());
        view->setImageManager(manager);
    }

    void TearDown() override {
        view.reset();
        ImageManager::setShared(nullptr);
    }

    SettingsGuard settings;
    std::shared_ptr<FakeImageManager> manager;
    std::unique_ptr<FakeDisplayView> view;
};

TEST_F(ImageViewLoadingControllerTest, ControllerIsCreatedOnceAndReused) {
    ImageViewLoadingController* first = &view->getImageLoadingController();
    view->setImageWith("http://host/a.png");
    view->cancelLoading();
    ImageViewLoadingController* second = &view->getImageLoadingController();

    EXPECT_EQ(first, second);
}

TEST_F(ImageViewLoadingControllerTest, NoTaskBeforeFirstLoad) {
    EXPECT_EQ(view->getImageTask(), nullptr);
    view->cancelLoading();
    EXPECT_EQ(view->getImageTask(), nullptr);
    EXPECT_TRUE(manager->cancelled.empty());
}

TEST_F(ImageViewLoadingControllerTest, CurrentTaskIsTheLastStarted) {
    ImageTaskPtr last;
    for (int i = 0; i < 5; i++) {
        last = view->setImageWith("http://host/" + std::to_string(i) + ".png");
        EXPECT_EQ(view->getImageTask(), last);
    }

    ASSERT_EQ(manager->resumed.size(), 5u);
    EXPECT_EQ(manager->resumed.back(), last);
    EXPECT_EQ(last->getRequest().url, "http://host/4.png");
}

TEST_F(ImageViewLoadingControllerTest, NewLoadCancelsPreviousTask) {
    ImageTaskPtr first = view->setImageWith("http://host/a.png");
    ImageTaskPtr second = view->setImageWith("http://host/b.png");

    ASSERT_EQ(manager->cancelled.size(), 1u);
    EXPECT_EQ(manager->cancelled[0], first);
    EXPECT_EQ(first->getState(), ImageTask::State::CANCELLED);
    EXPECT_EQ(second->getState(), ImageTask::State::RUNNING);
    EXPECT_TRUE(view->displayed.empty());
}

TEST_F(ImageViewLoadingControllerTest, StaleCompletionIsIgnoredWhenNotCancelled) {
    LoadingSettingsStore::getInstance().getSettings().cancelSupersededTasks = false;

    ImageTaskPtr first = view->setImageWith("http://host/a.png");
    ImageTaskPtr second = view->setImageWith("http://host/b.png");
    EXPECT_TRUE(manager->cancelled.empty());
    EXPECT_EQ(first->getState(), ImageTask::State::RUNNING);

    // Slow first load arrives after the view moved on
    first->complete(slowSuccess("http://host/a.png"));
    EXPECT_TRUE(view->displayed.empty());
    EXPECT_TRUE(view->animations.empty());
    EXPECT_EQ(view->getImageTask(), second);

    second->complete(slowSuccess("http://host/b.png"));
    ASSERT_EQ(view->displayed.size(), 1u);
    EXPECT_EQ(view->displayed[0]->url, "http://host/b.png");
}

TEST_F(ImageViewLoadingControllerTest, CancelLoadingDropsTaskAndSuppressesCompletion) {
    bool handlerCalled = false;
    ImageLoadingOptions options;
    options.handler = [&handlerCalled](ImageLoadingView&, const ImageTaskPtr&, const ImageResponse&,
                                       const ImageLoadingOptions&) {
        handlerCalled = true;
    };

    ImageTaskPtr task = view->setImageWith(ImageRequest("http://host/a.png"), options);
    view->cancelLoading();

    EXPECT_EQ(view->getImageTask(), nullptr);
    EXPECT_EQ(task->getState(), ImageTask::State::CANCELLED);
    ASSERT_EQ(manager->cancelled.size(), 1u);
    EXPECT_FALSE(handlerCalled);

    // Engine finishing anyway changes nothing
    EXPECT_FALSE(task->complete(slowSuccess("http://host/a.png")));
    EXPECT_FALSE(handlerCalled);
    EXPECT_TRUE(view->displayed.empty());
}

TEST_F(ImageViewLoadingControllerTest, CompletedTaskStaysCurrent) {
    ImageTaskPtr task = view->setImageWith("http://host/a.png");
    task->complete(slowSuccess("http://host/a.png"));

    EXPECT_EQ(view->getImageTask(), task);
    EXPECT_EQ(view->displayed.size(), 1u);
}

TEST_F(ImageViewLoadingControllerTest, SynchronousEngineCompletionReachesView) {
    manager->onResume = [](const ImageTaskPtr& task) {
        task->complete(fastSuccess(task->getRequest().url));
    };

    ImageTaskPtr task = view->setImageWith("http://host/cached.png");

    EXPECT_EQ(task->getState(), ImageTask::State::COMPLETED);
    ASSERT_EQ(view->displayed.size(), 1u);
    EXPECT_TRUE(view->animations.empty());
}

TEST_F(ImageViewLoadingControllerTest, FallsBackToSharedManager) {
    auto shared = std::make_shared<FakeImageManager>();
    ImageManager::setShared(shared);

    FakeDisplayView other;
    ImageTaskPtr task = other.setImageWith("http://host/a.png");

    ASSERT_EQ(shared->resumed.size(), 1u);
    EXPECT_EQ(shared->resumed[0], task);
    EXPECT_TRUE(manager->resumed.empty());
}

TEST_F(ImageViewLoadingControllerTest, MissingManagerCompletesWithFailure) {
    ImageResponse::Kind kind = ImageResponse::Kind::SUCCESS;
    ImageErrorCode code = ImageErrorCode::LOAD_FAILED;
    ImageLoadingOptions options;
    options.handler = [&kind, &code](ImageLoadingView&, const ImageTaskPtr&, const ImageResponse& response,
                                     const ImageLoadingOptions&) {
        kind = response.getKind();
        code = response.getError().code;
    };

    FakeDisplayView orphan;
    ImageTaskPtr task = orphan.setImageWith(ImageRequest("http://host/a.png"), options);

    ASSERT_NE(task, nullptr);
    EXPECT_EQ(orphan.getImageTask(), task);
    EXPECT_EQ(kind, ImageResponse::Kind::FAILURE);
    EXPECT_EQ(code, ImageErrorCode::NO_MANAGER);
    EXPECT_TRUE(orphan.displayed.empty());
}

TEST_F(ImageViewLoadingControllerTest, DeferredDeliveryAfterViewDestructionIsDropped) {
    QueuedDispatcher dispatcher;
    manager->setDispatcher(dispatcher.asDispatcher());

    bool handlerCalled = false;
    ImageLoadingOptions options;
    options.handler = [&handlerCalled](ImageLoadingView&, const ImageTaskPtr&, const ImageResponse&,
                                       const ImageLoadingOptions&) {
        handlerCalled = true;
    };

    ImageTaskPtr task = view->setImageWith(ImageRequest("http://host/a.png"), options);
    task->complete(slowSuccess("http://host/a.png"));
    EXPECT_EQ(dispatcher.pending(), 1u);

    view.reset();
    dispatcher.drain();

    EXPECT_FALSE(handlerCalled);
    EXPECT_TRUE(task->isFinished());
}

TEST_F(ImageViewLoadingControllerTest, DestroyingViewCancelsCurrentTask) {
    ImageTaskPtr task = view->setImageWith("http://host/a.png");
    view.reset();

    EXPECT_EQ(task->getState(), ImageTask::State::CANCELLED);
    ASSERT_EQ(manager->cancelled.size(), 1u);
}

TEST_F(ImageViewLoadingControllerTest, BackgroundCompletionDeliveredOnDrain) {
    QueuedDispatcher dispatcher;
    manager->setDispatcher(dispatcher.asDispatcher());

    ImageTaskPtr task = view->setImageWith("http://host/a.png");
    asyncRun([task]() {
        task->complete(slowSuccess("http://host/a.png"));
    });

    ASSERT_TRUE(dispatcher.waitForPending(1));
    EXPECT_TRUE(view->displayed.empty());

    dispatcher.drain();
    ASSERT_EQ(view->displayed.size(), 1u);
    EXPECT_EQ(view->animations.size(), 1u);
}

TEST(ImageLoadingViewTest, PlainLoadingViewIgnoresResultWithoutHandler) {
    class PlainView : public ImageLoadingView {};

    SettingsGuard settings;
    auto manager = std::make_shared<FakeImageManager>();
    PlainView view;
    view.setImageManager(manager);

    ImageTaskPtr task = view.setImageWith("http://host/a.png");
    task->complete(slowSuccess("http://host/a.png"));

    EXPECT_EQ(view.getImageTask(), task);
    EXPECT_EQ(task->getState(), ImageTask::State::COMPLETED);
}

} // namespace test
} // namespace vitafetch
