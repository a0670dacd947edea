#include "AvatarComponent.h"

namespace
{
    constexpr int kPlaceholderW = 240;
    constexpr int kPlaceholderH = 120;

    juce::Colour parseColour (const juce::String& css, juce::Colour fallback)
    {
        auto hex = css.trim();
        if (hex.startsWithChar ('#'))
            hex = hex.substring (1);

        if (hex.length() != 6 || ! hex.containsOnly ("0123456789abcdefABCDEF"))
            return fallback;

        return juce::Colour ((juce::uint32) (0xFF000000u | (juce::uint32) hex.getHexValue32()));
    }
}

AvatarComponent::AvatarComponent()
{
    setOpaque (false);
    setSize (kPlaceholderW, kPlaceholderH);
}

juce::Image AvatarComponent::loadScaled (const juce::File& file, int width)
{
    auto img = juce::ImageFileFormat::loadFrom (file);
    if (img.isNull() || img.getWidth() <= 0)
        return {};

    const int w = juce::jmax (1, width);
    const int h = juce::jmax (1, juce::roundToInt ((double) img.getHeight() * ((double) w / (double) img.getWidth())));

    return img.convertedToFormat (juce::Image::ARGB)
              .rescaled (w, h, juce::Graphics::highResamplingQuality);
}

void AvatarComponent::loadImages (const AvatarConfig& config)
{
    displayWidth = config.getDisplayWidth();
    cache.clear();

    juce::StringArray wanted (config.getIdleFrames());
    wanted.add (config.getTalkImage());
    for (const auto& tv : config.getTalkVariants())
        wanted.add (tv.image);
    wanted.removeEmptyStrings();
    wanted.removeDuplicates (false);

    juce::StringArray failures;
    for (const auto& path : wanted)
    {
        const juce::File f (juce::File::isAbsolutePath (path) ? juce::File (path)
                                                             : juce::File::getCurrentWorkingDirectory().getChildFile (path));
        auto img = loadScaled (f, displayWidth);
        if (img.isNull())
        {
            failures.add (path);
            continue;
        }

        cache[path] = img;
    }

    if (! failures.isEmpty())
    {
        juce::Logger::writeToLog ("avatar: could not load " + failures.joinIntoString (", "));
        juce::AlertWindow::showMessageBoxAsync (juce::MessageBoxIconType::WarningIcon,
                                                "Image error",
                                                "These images could not be loaded:\n" + failures.joinIntoString ("\n"));
    }
}

void AvatarComponent::applyAppearance (const AvatarConfig& config)
{
    background  = parseColour (config.getBackgroundColour(), juce::Colours::lime);
    transparent = config.isBackgroundTransparent();
    dragEnabled = config.isDragEnabled();
    repaint();
}

void AvatarComponent::showImage (const ImageHandle& handle)
{
    const auto it = cache.find (handle);
    current = (it != cache.end()) ? it->second : juce::Image();

    resizeToCurrent();
    repaint();
}

void AvatarComponent::resizeToCurrent()
{
    if (current.isNull())
        setSize (kPlaceholderW, kPlaceholderH);
    else
        setSize (current.getWidth(), current.getHeight());
}

void AvatarComponent::paint (juce::Graphics& g)
{
    if (! transparent)
        g.fillAll (background);

    if (current.isNull())
    {
        g.setColour (transparent ? juce::Colours::white : background.contrasting());
        g.setFont (15.0f);
        g.drawText ("No images loaded", getLocalBounds(), juce::Justification::centred, false);
        return;
    }

    g.drawImageAt (current, 0, 0);
}

void AvatarComponent::mouseDown (const juce::MouseEvent& e)
{
    if (! dragEnabled || ! e.mods.isLeftButtonDown())
        return;

    if (auto* top = getTopLevelComponent())
    {
        dragger.startDraggingComponent (top, e.getEventRelativeTo (top));
        dragging = true;
    }
}

void AvatarComponent::mouseDrag (const juce::MouseEvent& e)
{
    if (! dragging)
        return;

    if (auto* top = getTopLevelComponent())
        dragger.dragComponent (top, e.getEventRelativeTo (top), nullptr);
}

void AvatarComponent::mouseUp (const juce::MouseEvent&)
{
    if (! dragging)
        return;

    dragging = false;

    if (onMoved != nullptr)
        if (auto* top = getTopLevelComponent())
            onMoved (top->getPosition());
}

//==============================================================================
AvatarWindow::AvatarWindow (const AvatarConfig& config, AvatarComponent& content)
    : juce::DocumentWindow ("Avatar", juce::Colours::transparentBlack, 0)
{
    setUsingNativeTitleBar (false);
    setTitleBarHeight (0);
    setDropShadowEnabled (false);
    setContentNonOwned (&content, true);
    applyAppearance (config);

    if (config.isRememberPosition() && config.hasAvatarPosition())
        setTopLeftPosition (config.getAvatarX(), config.getAvatarY());
    else
        centreWithSize (getWidth(), getHeight());

    setVisible (true);
}

void AvatarWindow::applyAppearance (const AvatarConfig& config)
{
    setOpaque (! config.isBackgroundTransparent());
    setAlwaysOnTop (config.isKeepOnTop());
}
