/**
 * VitaFetch - Image Displaying View
 * Loading view that can show an image and animate its layer
 */

#pragma once

#include "view/image_loading_view.hpp"
#include "loading/image_response.hpp"

#include <memory>
#include <string>

namespace vitafetch {

class ImageCompletionPolicy;

// Property animation attached to a view's layer under a key
struct LayerAnimation {
    std::string property = "opacity";
    float fromValue = 0.0f;
    float toValue = 1.0f;
    float duration = 0.25f;  // seconds
};

class ImageDisplayingView : public ImageLoadingView {
public:
    ImageDisplayingView();
    ~ImageDisplayingView() override;

    // Displays a given image, nullptr clears the view
    virtual void displayImage(const Image& image) = 0;

    // Adding under a key that is already animating replaces that animation
    virtual void addAnimation(const std::string& key, const LayerAnimation& animation) = 0;
    virtual void removeAnimation(const std::string& key) = 0;

    // nullptr restores the default policy
    void setCompletionPolicy(std::shared_ptr<ImageCompletionPolicy> policy);
    ImageCompletionPolicy& getCompletionPolicy();

protected:
    void handleDefaultCompletion(const ImageTaskPtr& task, const ImageResponse& response,
                                 const ImageLoadingOptions& options) override;

private:
    std::shared_ptr<ImageCompletionPolicy> m_completionPolicy;
};

} // namespace vitafetch
