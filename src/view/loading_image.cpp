/**
 * VitaFetch - Loading Image implementation
 */

#include "view/loading_image.hpp"

#include <vector>

namespace vitafetch {

LoadingImage::LoadingImage() {
    this->setScalingType(brls::ImageScalingType::FIT);
}

LoadingImage::~LoadingImage() {
    // Stop tick callbacks before the view goes away
    for (auto& entry : m_animations) {
        entry.second.stop();
    }
}

void LoadingImage::displayImage(const vitafetch::Image& image) {
    if (!image || image->bytes.empty()) {
        this->clear();
        return;
    }

    // setImageFromMem takes a mutable buffer
    std::vector<uint8_t> data = image->bytes;
    this->setImageFromMem(data.data(), (int)data.size());
}

void LoadingImage::addAnimation(const std::string& key, const LayerAnimation& animation) {
    if (animation.property != "opacity") {
        brls::Logger::warning("LoadingImage: Unsupported animation property {}", animation.property);
        return;
    }

    brls::Animatable& animatable = m_animations[key];

    // Replace whatever is still running under this key
    animatable.stop();
    animatable.reset(animation.fromValue);
    animatable.addStep(animation.toValue, (int32_t)(animation.duration * 1000.0f), brls::EasingFunction::linear);

    this->setAlpha(animation.fromValue);
    animatable.setTickCallback([this, &animatable]() {
        this->setAlpha(animatable.getValue());
    });
    float finalValue = animation.toValue;
    animatable.setEndCallback([this, finalValue](bool finished) {
        if (finished) {
            this->setAlpha(finalValue);
        }
    });
    animatable.start();
}

void LoadingImage::removeAnimation(const std::string& key) {
    auto it = m_animations.find(key);
    if (it == m_animations.end()) return;

    it->second.stop();
    m_animations.erase(it);
    this->setAlpha(1.0f);
}

brls::View* LoadingImage::create() {
    return new LoadingImage();
}

} // namespace vitafetch
