#pragma once
#include <juce_core/juce_core.h>
#include "../Config/AvatarConfig.h"

// Presentation-side subscriber of the engine. All calls arrive on the message thread.
// An empty ImageHandle asks the sink to show its "no image" placeholder.
class RenderSink
{
public:
    virtual ~RenderSink() = default;

    virtual void onLevelUpdate (double smoothedLevel) = 0;
    virtual void onTalkStateChanged (bool isTalking) = 0;
    virtual void onVariantChanged (const ImageHandle& image) = 0;
    virtual void onIdleFrameChanged (const ImageHandle& image) = 0;

    // Raised once when polling stops after a runtime fault.
    virtual void onEngineFault (const juce::String& message) { juce::ignoreUnused (message); }
};
