#pragma once
#include <juce_gui_basics/juce_gui_basics.h>
#include <functional>
#include <map>
#include "../Config/AvatarConfig.h"

// Draws the engine-resolved avatar image, or a placeholder when there is none.
class AvatarComponent final : public juce::Component
{
public:
    AvatarComponent();

    // Loads and scales every image the config references. Unreadable files are
    // reported once per call and then behave like missing images.
    void loadImages (const AvatarConfig& config);

    // Appearance-only settings (background, drag).
    void applyAppearance (const AvatarConfig& config);

    void showImage (const ImageHandle& handle);

    // Called with the window's top-left after a drag ends.
    std::function<void (juce::Point<int>)> onMoved;

    void paint (juce::Graphics& g) override;
    void mouseDown (const juce::MouseEvent& e) override;
    void mouseDrag (const juce::MouseEvent& e) override;
    void mouseUp (const juce::MouseEvent& e) override;

    static juce::Image loadScaled (const juce::File& file, int width);

private:
    void resizeToCurrent();

    std::map<juce::String, juce::Image> cache;
    juce::Image current;
    int displayWidth = AvatarConfig::kWidthDefault;

    juce::Colour background { juce::Colours::lime };
    bool transparent = false;
    bool dragEnabled = true;
    bool dragging = false;
    juce::ComponentDragger dragger;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AvatarComponent)
};

// Frameless host window for the avatar.
class AvatarWindow final : public juce::DocumentWindow
{
public:
    AvatarWindow (const AvatarConfig& config, AvatarComponent& content);

    void applyAppearance (const AvatarConfig& config);

    void closeButtonPressed() override {}

private:
    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (AvatarWindow)
};
