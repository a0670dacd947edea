#include "PanelComponent.h"
#include "talk_core/talk_core.h"

//==============================================================================
// LOOK & FEEL: recessed controls on a dark panel
class PanelLookAndFeel final : public juce::LookAndFeel_V4
{
public:
    void drawButtonBackground (juce::Graphics& g, juce::Button& button, const juce::Colour&, bool, bool) override
    {
        auto r = button.getLocalBounds().toFloat();
        const bool down = button.isMouseButtonDown();

        // 1. Recessed base
        g.setColour (juce::Colour (0xFF0A0A0A));
        g.fillRoundedRectangle (r, 4.0f);

        // 2. Inner shadow
        g.setColour (juce::Colours::black.withAlpha (0.8f));
        g.drawRoundedRectangle (r.translated (0.5f, 0.5f), 4.0f, 1.0f);

        // 3. Bottom highlight
        g.setColour (juce::Colours::white.withAlpha (0.08f));
        g.drawRoundedRectangle (r.translated (-0.5f, -0.5f), 4.0f, 1.0f);

        if (down)
        {
            g.setColour (juce::Colour (0xFFE6A532).withAlpha (0.15f));
            g.fillRoundedRectangle (r.reduced (2.0f), 3.0f);
        }
    }

    void drawButtonText (juce::Graphics& g, juce::TextButton& button, bool, bool) override
    {
        g.setFont (12.0f);
        g.setColour (juce::Colours::white.withAlpha (0.7f));
        g.drawText (button.getButtonText(), button.getLocalBounds(), juce::Justification::centred, false);
    }
};

//==============================================================================
PanelComponent::PanelComponent (const AvatarConfig& c, AvatarComponent& a)
    : config (c), avatar (a)
{
    lnf = std::make_unique<PanelLookAndFeel>();
    setLookAndFeel (lnf.get());

    addAndMakeVisible (meter);

    talkLabel.setText ("Talk threshold", juce::dontSendNotification);
    addAndMakeVisible (talkLabel);

    talkThreshold.setSliderStyle (juce::Slider::LinearHorizontal);
    talkThreshold.setTextBoxStyle (juce::Slider::TextBoxRight, false, 64, 20);
    talkThreshold.setRange (talk_core::kTalkThresholdMin, talk_core::kTalkThresholdMax, 0.001);
    talkThreshold.setValue (config.getTalkThreshold(), juce::dontSendNotification);
    talkThreshold.onValueChange = [this]
    {
        config = config.withTalkThreshold (talkThreshold.getValue());
        meter.setThresholds (config.getTalkThreshold(), config.getTalkVariants());
        if (onConfigChanged)
            onConfigChanged (config);
    };
    addAndMakeVisible (talkThreshold);

    stateLabel.setText ("Idle", juce::dontSendNotification);
    stateLabel.setJustificationType (juce::Justification::centredLeft);
    addAndMakeVisible (stateLabel);

    saveButton.onClick = [this]
    {
        if (! onSaveRequested)
            return;

        const auto result = onSaveRequested();
        showSaveStatus (result.wasOk() ? juce::String ("Saved") : "Save failed: " + result.getErrorMessage());
    };
    addAndMakeVisible (saveButton);

    saveStatus.setJustificationType (juce::Justification::centredRight);
    addChildComponent (saveStatus);

    meter.setThresholds (config.getTalkThreshold(), config.getTalkVariants());

    setSize (520, 180);
}

PanelComponent::~PanelComponent()
{
    setLookAndFeel (nullptr);
}

void PanelComponent::setConfig (const AvatarConfig& c)
{
    config = c;
    talkThreshold.setValue (config.getTalkThreshold(), juce::dontSendNotification);
    meter.setThresholds (config.getTalkThreshold(), config.getTalkVariants());
}

void PanelComponent::onLevelUpdate (double smoothedLevel)
{
    // Skip repaints below display resolution.
    const float v = (float) smoothedLevel;
    if (std::abs (v - lastLevel) < 0.0005f)
        return;

    lastLevel = v;
    meter.setLevel (smoothedLevel);
    meter.repaint();
}

void PanelComponent::onTalkStateChanged (bool isTalking)
{
    stateLabel.setText (isTalking ? "Talking" : "Idle", juce::dontSendNotification);
}

void PanelComponent::onVariantChanged (const ImageHandle& image)
{
    avatar.showImage (image);
}

void PanelComponent::onIdleFrameChanged (const ImageHandle& image)
{
    avatar.showImage (image);
}

void PanelComponent::onEngineFault (const juce::String& message)
{
    if (faultShown)
        return;

    faultShown = true;
    stateLabel.setText ("Microphone stopped", juce::dontSendNotification);
    juce::AlertWindow::showMessageBoxAsync (juce::MessageBoxIconType::WarningIcon,
                                            "Microphone error",
                                            "Reading the microphone failed and monitoring has stopped.\n" + message);
}

void PanelComponent::showSaveStatus (const juce::String& text)
{
    saveStatus.setText (text, juce::dontSendNotification);
    saveStatus.setVisible (true);

    juce::Component::SafePointer<PanelComponent> safe (this);
    juce::Timer::callAfterDelay (5000, [safe]
    {
        if (safe != nullptr)
            safe->saveStatus.setVisible (false);
    });
}

void PanelComponent::paint (juce::Graphics& g)
{
    g.fillAll (juce::Colour (0xFF151515));
}

void PanelComponent::resized()
{
    auto r = getLocalBounds();
    r.removeFromLeft (Layout::insetL);
    r.removeFromRight (Layout::insetR);
    r.removeFromTop (Layout::insetT);
    r.removeFromBottom (Layout::insetB);

    meter.setBounds (r.removeFromTop (Layout::meterBand));
    r.removeFromTop (Layout::interBandGap);

    auto row = r.removeFromTop (Layout::controlRow);
    talkLabel.setBounds (row.removeFromLeft (110));
    talkThreshold.setBounds (row);
    r.removeFromTop (Layout::interBandGap);

    auto status = r.removeFromTop (Layout::statusRow);
    saveButton.setBounds (status.removeFromRight (80));
    status.removeFromRight (8);
    saveStatus.setBounds (status.removeFromRight (180));
    stateLabel.setBounds (status);
}
