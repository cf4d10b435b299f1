/**
 * VitaFetch - Loading Image
 * brls::Image that loads its content through an image task
 */

#pragma once

#include <borealis.hpp>
#include <map>
#include <string>

#include "view/image_displaying_view.hpp"

namespace vitafetch {

class LoadingImage : public brls::Image, public ImageDisplayingView {
public:
    LoadingImage();
    ~LoadingImage() override;

    void displayImage(const vitafetch::Image& image) override;

    // Only "opacity" is supported, mapped onto the view alpha
    void addAnimation(const std::string& key, const LayerAnimation& animation) override;
    void removeAnimation(const std::string& key) override;

    // Animations currently attached, one per key
    size_t getAnimationCount() const { return m_animations.size(); }
    bool hasAnimation(const std::string& key) const { return m_animations.count(key) > 0; }

    static brls::View* create();

private:
    std::map<std::string, brls::Animatable> m_animations;
};

} // namespace vitafetch
