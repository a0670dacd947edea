#pragma once
#include <juce_gui_basics/juce_gui_basics.h>
#include <cmath>
#include <functional>
#include <vector>
#include "../Engine/RenderSink.h"
#include "AvatarComponent.h"

namespace Layout
{
    static constexpr int insetL = 18;
    static constexpr int insetR = 18;
    static constexpr int insetT = 14;
    static constexpr int insetB = 14;

    static constexpr int meterBand    = 60;
    static constexpr int controlRow   = 32;
    static constexpr int statusRow    = 24;
    static constexpr int interBandGap = 10;
}

class LevelMeter final : public juce::Component
{
public:
    void setLevel (double smoothed) noexcept
    {
        if (! std::isfinite (smoothed)) smoothed = 0.0;
        level = (float) juce::jmax (0.0, smoothed);
    }

    void setThresholds (double talk, const std::vector<TalkVariant>& variants)
    {
        talkTh = (float) juce::jmax (0.0, talk);
        tierMarks.clear();
        for (const auto& tv : variants)
            tierMarks.push_back ((float) tv.threshold);
        repaint();
    }

    void paint (juce::Graphics& g) override
    {
        auto r = getLocalBounds().toFloat();

        constexpr float kInsetXPx      = 8.0f;
        constexpr float kInsetYPx      = 8.0f;
        constexpr int   kBarsMax       = 80;
        constexpr float kGapPx         = 1.0f;
        constexpr float kMinBarWPx     = 2.0f;
        constexpr float kActiveAlpha   = 0.70f;
        constexpr float kInactiveAlpha = 0.12f;

        const juce::Colour cGreen = juce::Colour::fromFloatRGBA (0.30f, 0.69f, 0.31f, 1.0f);
        const juce::Colour cAmber = juce::Colour::fromFloatRGBA (1.00f, 0.76f, 0.03f, 1.0f);
        const juce::Colour cTier  = juce::Colour::fromFloatRGBA (1.00f, 0.34f, 0.13f, 1.0f);
        const juce::Colour cGrey  = juce::Colour::fromFloatRGBA (0.62f, 0.62f, 0.62f, 1.0f);

        g.setColour (juce::Colours::white.withAlpha (0.09f));
        g.drawRoundedRectangle (r.reduced (1.0f), 6.0f, 1.0f);

        auto a = r.reduced (kInsetXPx, kInsetYPx);

        // Scale follows the louder of level and threshold so both stay on screen.
        const float scale = juce::jmax (0.001f, juce::jmax (level, talkTh) * 1.5f);
        auto toX = [&] (float v) { return a.getX() + a.getWidth() * juce::jlimit (0.0f, 1.0f, v / scale); };

        const float denom = kMinBarWPx + kGapPx;
        const int bars = juce::jlimit (1, kBarsMax, (int) std::floor ((a.getWidth() + kGapPx) / denom));
        const float barW = juce::jmax (kMinBarWPx, (a.getWidth() - kGapPx * (float) (bars - 1)) / (float) bars);
        const int lit = (int) std::floor (juce::jlimit (0.0f, 1.0f, level / scale) * (float) bars + 0.5f);

        for (int i = 0; i < bars; ++i)
        {
            juce::Rectangle<float> b (a.getX() + (float) i * (barW + kGapPx), a.getY(), barW, a.getHeight());
            g.setColour (i < lit ? cGreen.withAlpha (kActiveAlpha) : cGrey.withAlpha (kInactiveAlpha));
            g.fillRect (b);
        }

        g.setColour (cAmber);
        const float tx = toX (talkTh);
        g.drawLine (tx, a.getY(), tx, a.getBottom(), 2.0f);

        if (! tierMarks.empty())
        {
            const float dashes[] = { 4.0f, 3.0f };
            g.setColour (cTier);
            for (float m : tierMarks)
            {
                const float mx = toX (m);
                g.drawDashedLine (juce::Line<float> (mx, a.getY(), mx, a.getBottom()), dashes, 2, 1.0f);
            }
        }

        auto summary = juce::String::formatted ("Level %.3f | Talk %.3f", level, talkTh);
        if (! tierMarks.empty())
        {
            juce::StringArray parts;
            for (float m : tierMarks)
                parts.add (juce::String (m, 3));
            summary << " | Tiers " << parts.joinIntoString (", ");
        }

        g.setColour (juce::Colours::white.withAlpha (0.85f));
        g.setFont (12.0f);
        g.drawText (summary, a.toNearestInt(), juce::Justification::centred, false);
    }

private:
    float level = 0.0f;
    float talkTh = 0.03f;
    std::vector<float> tierMarks;
};


class PanelLookAndFeel;

// Control panel and RenderSink: meter, live talk threshold, save.
class PanelComponent final
    : public juce::Component
    , public RenderSink
{
public:
    PanelComponent (const AvatarConfig& config, AvatarComponent& avatar);
    ~PanelComponent() override;

    // Fired with the new snapshot after a panel edit.
    std::function<void (const AvatarConfig&)> onConfigChanged;
    // Fired when the user asks to persist the current snapshot.
    std::function<juce::Result()> onSaveRequested;

    void setConfig (const AvatarConfig& config);

    void onLevelUpdate (double smoothedLevel) override;
    void onTalkStateChanged (bool isTalking) override;
    void onVariantChanged (const ImageHandle& image) override;
    void onIdleFrameChanged (const ImageHandle& image) override;
    void onEngineFault (const juce::String& message) override;

    void paint (juce::Graphics&) override;
    void resized() override;

private:
    void showSaveStatus (const juce::String& text);

    AvatarConfig config;
    AvatarComponent& avatar;

    std::unique_ptr<PanelLookAndFeel> lnf;

    LevelMeter meter;
    juce::Label talkLabel;
    juce::Slider talkThreshold;
    juce::Label stateLabel;
    juce::TextButton saveButton { "Save" };
    juce::Label saveStatus;

    bool faultShown = false;
    float lastLevel = -1.0f;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (PanelComponent)
};
