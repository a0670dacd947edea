#include "AvatarConfig.h"
#include "talk_core/talk_core.h"
#include "talk_core/variant_tiers.h"

namespace
{
    bool isNumericVar (const juce::var& v) noexcept
    {
        return v.isDouble() || v.isInt() || v.isInt64();
    }

    // Accepts JSON numbers and numeric strings ("0.05"); anything else fails.
    bool readNumber (const juce::var& v, double& out)
    {
        if (isNumericVar (v))
        {
            out = (double) v;
            return std::isfinite (out);
        }

        if (v.isString())
        {
            const auto s = v.toString().trim();
            if (s.isEmpty() || ! s.containsOnly ("0123456789.-+eE"))
                return false;

            out = s.getDoubleValue();
            return std::isfinite (out);
        }

        return false;
    }

    double readDouble (const juce::var& v, double fallback)
    {
        double d = 0.0;
        return readNumber (v, d) ? d : fallback;
    }

    bool readBool (const juce::var& v, bool fallback)
    {
        if (v.isBool() || isNumericVar (v))
            return (bool) v;
        return fallback;
    }

    juce::StringArray readPathList (const juce::var& v)
    {
        juce::StringArray paths;
        if (auto* arr = v.getArray())
        {
            for (const auto& item : *arr)
            {
                if (item.isString())
                    paths.add (item.toString().trim());
            }
        }
        paths.removeEmptyStrings();
        return paths;
    }

    std::vector<TalkVariant> readVariants (const juce::var& v)
    {
        std::vector<TalkVariant> variants;
        auto* arr = v.getArray();
        if (arr == nullptr)
            return variants;

        for (int i = 0; i < arr->size(); ++i)
        {
            const auto& item = arr->getReference (i);
            auto* obj = item.getDynamicObject();
            if (obj == nullptr)
            {
                juce::Logger::writeToLog ("config: talk_frames[" + juce::String (i) + "] is not an object, dropped");
                continue;
            }

            const auto image = obj->getProperty ("image").toString().trim();
            if (image.isEmpty())
                continue;

            double threshold = 0.0;
            if (obj->hasProperty ("threshold") && ! readNumber (obj->getProperty ("threshold"), threshold))
            {
                juce::Logger::writeToLog ("config: talk_frames[" + juce::String (i) + "] has a non-numeric threshold, dropped");
                continue;
            }

            variants.push_back ({ threshold, image });
        }

        return variants;
    }
}

AvatarConfig::AvatarConfig()
    : talkThreshold (talk_core::kTalkThresholdDefault),
      idleIntervalMinSec (talk_core::kIdleIntervalMinDefault),
      idleIntervalMaxSec (talk_core::kIdleIntervalMaxDefault)
{
}

void AvatarConfig::normalise()
{
    talkThreshold = talk_core::clampTalkThreshold (talkThreshold);

    idleFrames.trim();
    idleFrames.removeEmptyStrings();

    idleIntervalMinSec = talk_core::clampIdleIntervalSec (idleIntervalMinSec, talk_core::kIdleIntervalMinDefault);
    idleIntervalMaxSec = talk_core::clampIdleIntervalSec (idleIntervalMaxSec, talk_core::kIdleIntervalMaxDefault);
    if (idleIntervalMaxSec < idleIntervalMinSec)
        idleIntervalMaxSec = idleIntervalMinSec;

    idleImage = idleImage.trim();
    talkImage = talkImage.trim();

    std::vector<TalkVariant> kept;
    kept.reserve (talkVariants.size());
    for (auto& tv : talkVariants)
    {
        if (! std::isfinite (tv.threshold) || tv.image.trim().isEmpty())
            continue;
        kept.push_back ({ juce::jmax (0.0, tv.threshold), tv.image.trim() });
    }
    talk_core::sortTiers (kept);
    talkVariants = std::move (kept);

    displayWidth = juce::jlimit (kWidthMin, kWidthMax, displayWidth);
}

AvatarConfig AvatarConfig::fromVar (const juce::var& v)
{
    AvatarConfig c;

    if (! v.isObject())
    {
        if (! v.isVoid())
            juce::Logger::writeToLog ("config: settings root is not an object, using defaults");
        return c;
    }

    c.talkThreshold = readDouble (v["talk_th"], talk_core::kTalkThresholdDefault);

    if (v["idle_image"].isString())
        c.idleImage = v["idle_image"].toString().trim();

    c.idleFrames = readPathList (v["idle_frames"]);
    if (c.idleFrames.isEmpty() && c.idleImage.isNotEmpty())
        c.idleFrames.add (c.idleImage);

    if (v["talk_image"].isString())
        c.talkImage = v["talk_image"].toString();

    c.talkVariants = readVariants (v["talk_frames"]);

    c.idleRandom         = readBool (v["idle_anim_random"], false);
    c.idleIntervalMinSec = readDouble (v["idle_interval_min"], talk_core::kIdleIntervalMinDefault);
    c.idleIntervalMaxSec = readDouble (v["idle_interval_max"], talk_core::kIdleIntervalMaxDefault);
    c.displayWidth       = (int) juce::jlimit ((double) kWidthMin, (double) kWidthMax,
                                               readDouble (v["width"], (double) kWidthDefault));

    if (v["bg"].isString() && v["bg"].toString().isNotEmpty())
        c.backgroundColour = v["bg"].toString();

    c.backgroundTransparent = readBool (v["bg_transparent"], false);
    c.keepOnTop             = readBool (v["keep_on_top"], false);
    c.dragEnabled           = readBool (v["drag_enabled"], true);
    c.rememberPosition      = readBool (v["remember_position"], false);

    if (auto* pos = v["avatar_position"].getArray())
    {
        double x = 0.0, y = 0.0;
        if (pos->size() == 2 && readNumber (pos->getReference (0), x) && readNumber (pos->getReference (1), y)
            && std::abs (x) < 1.0e6 && std::abs (y) < 1.0e6)
        {
            c.hasPosition = true;
            c.positionX = (int) x;
            c.positionY = (int) y;
        }
    }

    c.normalise();
    return c;
}

juce::var AvatarConfig::toVar() const
{
    auto* obj = new juce::DynamicObject();
    juce::var root (obj);

    juce::Array<juce::var> frames;
    for (const auto& f : idleFrames)
        frames.add (f);

    juce::Array<juce::var> variants;
    for (const auto& tv : talkVariants)
    {
        auto* entry = new juce::DynamicObject();
        entry->setProperty ("image", tv.image);
        entry->setProperty ("threshold", tv.threshold);
        variants.add (juce::var (entry));
    }

    juce::Array<juce::var> position;
    if (hasPosition)
    {
        position.add (positionX);
        position.add (positionY);
    }

    obj->setProperty ("idle_image",        idleImage);
    obj->setProperty ("talk_image",        talkImage);
    obj->setProperty ("talk_frames",       variants);
    obj->setProperty ("bg",                backgroundColour);
    obj->setProperty ("bg_transparent",    backgroundTransparent);
    obj->setProperty ("width",             displayWidth);
    obj->setProperty ("talk_th",           talkThreshold);
    obj->setProperty ("keep_on_top",       keepOnTop);
    obj->setProperty ("drag_enabled",      dragEnabled);
    obj->setProperty ("idle_frames",       frames);
    obj->setProperty ("idle_anim_random",  idleRandom);
    obj->setProperty ("idle_interval_min", idleIntervalMinSec);
    obj->setProperty ("idle_interval_max", idleIntervalMaxSec);
    obj->setProperty ("remember_position", rememberPosition);
    obj->setProperty ("avatar_position",   position);

    return root;
}

bool AvatarConfig::hasSameImagesAs (const AvatarConfig& other) const
{
    if (idleFrames != other.idleFrames || talkImage != other.talkImage
        || displayWidth != other.displayWidth || talkVariants.size() != other.talkVariants.size())
        return false;

    for (size_t i = 0; i < talkVariants.size(); ++i)
        if (talkVariants[i].image != other.talkVariants[i].image)
            return false;

    return true;
}

bool AvatarConfig::hasSameAppearanceAs (const AvatarConfig& other) const noexcept
{
    return backgroundColour == other.backgroundColour
        && backgroundTransparent == other.backgroundTransparent
        && keepOnTop == other.keepOnTop
        && dragEnabled == other.dragEnabled;
}

AvatarConfig AvatarConfig::withTalkThreshold (double th) const
{
    auto c = *this;
    c.talkThreshold = th;
    c.normalise();
    return c;
}

AvatarConfig AvatarConfig::withIdleFrames (const juce::StringArray& frames) const
{
    auto c = *this;
    c.idleFrames = frames;
    c.normalise();
    return c;
}

AvatarConfig AvatarConfig::withTalkImage (const ImageHandle& image) const
{
    auto c = *this;
    c.talkImage = image;
    c.normalise();
    return c;
}

AvatarConfig AvatarConfig::withTalkVariants (std::vector<TalkVariant> variants) const
{
    auto c = *this;
    c.talkVariants = std::move (variants);
    c.normalise();
    return c;
}

AvatarConfig AvatarConfig::withIdleTiming (double minSec, double maxSec, bool randomOrder) const
{
    auto c = *this;
    c.idleIntervalMinSec = minSec;
    c.idleIntervalMaxSec = maxSec;
    c.idleRandom = randomOrder;
    c.normalise();
    return c;
}

AvatarConfig AvatarConfig::withAvatarPosition (int x, int y) const
{
    auto c = *this;
    c.hasPosition = true;
    c.positionX = x;
    c.positionY = y;
    return c;
}

//==============================================================================
ConfigStore::ConfigStore (juce::File settingsFile)
    : file (std::move (settingsFile))
{
}

juce::File ConfigStore::defaultSettingsFile()
{
    return juce::File::getSpecialLocation (juce::File::userApplicationDataDirectory)
               .getChildFile ("TalkSprite")
               .getChildFile ("talk_sprite.json");
}

AvatarConfig ConfigStore::load() const
{
    if (! file.existsAsFile())
        return AvatarConfig();

    juce::var parsed;
    const auto result = juce::JSON::parse (file.loadFileAsString(), parsed);
    if (result.failed())
    {
        juce::Logger::writeToLog ("config: " + file.getFullPathName() + " is not valid JSON ("
                                  + result.getErrorMessage() + "), using defaults");
        return AvatarConfig();
    }

    return AvatarConfig::fromVar (parsed);
}

juce::Result ConfigStore::save (const AvatarConfig& config) const
{
    const auto dir = file.getParentDirectory();
    if (! dir.isDirectory())
    {
        const auto created = dir.createDirectory();
        if (created.failed())
            return created;
    }

    if (! file.replaceWithText (juce::JSON::toString (config.toVar())))
        return juce::Result::fail ("Could not write " + file.getFullPathName());

    juce::Logger::writeToLog ("config: saved " + file.getFullPathName());
    return juce::Result::ok();
}
