#pragma once
#include <juce_core/juce_core.h>
#include <vector>

// Opaque image handle: a file path as understood by the image-loading side.
// An empty handle is the "no image" placeholder.
using ImageHandle = juce::String;

struct TalkVariant final
{
    double      threshold = 0.0;
    ImageHandle image;
};

// Immutable configuration snapshot.
//
// Every construction path goes through normalisation, so an AvatarConfig is always valid:
// - talkThreshold in [0.001, 0.5]
// - idle interval bounds in [0.05, 10.0] with min <= max
// - talkVariants non-negative and stably sorted ascending by threshold
// Mutation produces a new snapshot via the with...() builders.
class AvatarConfig final
{
public:
    AvatarConfig();

    // Heal-don't-fail load: malformed values are clamped or dropped, never reported as errors.
    static AvatarConfig fromVar (const juce::var& v);
    juce::var toVar() const;

    double getTalkThreshold() const noexcept       { return talkThreshold; }
    const juce::StringArray& getIdleFrames() const noexcept          { return idleFrames; }
    const ImageHandle& getIdleImage() const noexcept                 { return idleImage; }
    const ImageHandle& getTalkImage() const noexcept                 { return talkImage; }
    const std::vector<TalkVariant>& getTalkVariants() const noexcept { return talkVariants; }
    bool isIdleRandom() const noexcept             { return idleRandom; }
    double getIdleIntervalMinSec() const noexcept  { return idleIntervalMinSec; }
    double getIdleIntervalMaxSec() const noexcept  { return idleIntervalMaxSec; }
    int getDisplayWidth() const noexcept           { return displayWidth; }

    // Presentation-side values; the engine ignores them.
    const juce::String& getBackgroundColour() const noexcept { return backgroundColour; }
    bool isBackgroundTransparent() const noexcept  { return backgroundTransparent; }
    bool isKeepOnTop() const noexcept              { return keepOnTop; }
    bool isDragEnabled() const noexcept            { return dragEnabled; }
    bool isRememberPosition() const noexcept       { return rememberPosition; }
    bool hasAvatarPosition() const noexcept        { return hasPosition; }
    int getAvatarX() const noexcept                { return positionX; }
    int getAvatarY() const noexcept                { return positionY; }

    // True when both snapshots reference the same images at the same display width.
    bool hasSameImagesAs (const AvatarConfig& other) const;
    bool hasSameAppearanceAs (const AvatarConfig& other) const noexcept;

    AvatarConfig withTalkThreshold (double th) const;
    AvatarConfig withIdleFrames (const juce::StringArray& frames) const;
    AvatarConfig withTalkImage (const ImageHandle& image) const;
    AvatarConfig withTalkVariants (std::vector<TalkVariant> variants) const;
    AvatarConfig withIdleTiming (double minSec, double maxSec, bool randomOrder) const;
    AvatarConfig withAvatarPosition (int x, int y) const;

    static constexpr int kWidthMin     = 64;
    static constexpr int kWidthMax     = 1024;
    static constexpr int kWidthDefault = 512;

private:
    void normalise();

    double talkThreshold;
    juce::StringArray idleFrames;
    ImageHandle idleImage;  // single-frame fallback, persisted as given
    ImageHandle talkImage;
    std::vector<TalkVariant> talkVariants;
    bool idleRandom = false;
    double idleIntervalMinSec;
    double idleIntervalMaxSec;
    int displayWidth = kWidthDefault;

    juce::String backgroundColour { "#00FF00" };
    bool backgroundTransparent = false;
    bool keepOnTop = false;
    bool dragEnabled = true;
    bool rememberPosition = false;
    bool hasPosition = false;
    int positionX = 0;
    int positionY = 0;

    JUCE_LEAK_DETECTOR (AvatarConfig)
};

// JSON persistence of AvatarConfig.
class ConfigStore final
{
public:
    explicit ConfigStore (juce::File settingsFile);

    static juce::File defaultSettingsFile();

    // Missing or unreadable file yields the defaults.
    AvatarConfig load() const;
    juce::Result save (const AvatarConfig& config) const;

    const juce::File& getFile() const noexcept { return file; }

private:
    juce::File file;
};
