#include "TalkEngine.h"
#include "talk_core/variant_tiers.h"

TalkEngine::TalkEngine (std::unique_ptr<LoudnessSampler> s, const AvatarConfig& c, RenderSink& rs)
    : sampler (std::move (s)),
      config (c),
      sink (rs),
      clockOriginSec (juce::Time::getMillisecondCounterHiRes() * 0.001),
      talk (c.getTalkThreshold(), 0.0)
{
    jassert (sampler != nullptr);

    idle.onFrameAdvanced = [this] (int index)
    {
        sink.onIdleFrameChanged (idleImageAt (index));
    };
}

TalkEngine::~TalkEngine()
{
    shutdown();
}

void TalkEngine::start()
{
    faulted = false;

    sink.onTalkStateChanged (talk.isTalking());
    emitCurrentImage();

    idle.setTiming (config.getIdleIntervalMinSec(), config.getIdleIntervalMaxSec(), config.isIdleRandom());
    idle.setSuspended (talk.isTalking());
    idle.setFrameCount (config.getIdleFrames().size());

    startTimer (talk_core::kPollIntervalMs);
}

void TalkEngine::applyConfiguration (const AvatarConfig& newConfig, ReconfigurePolicy policy)
{
    const bool framesChanged = (newConfig.getIdleFrames() != config.getIdleFrames());
    config = newConfig;

    talk.setTalkThreshold (config.getTalkThreshold());

    // Next-tick semantics: a running idle delay is left as drawn.
    idle.setTiming (config.getIdleIntervalMinSec(), config.getIdleIntervalMaxSec(), config.isIdleRandom());

    if (policy == ReconfigurePolicy::ResetState)
    {
        const bool wasTalking = talk.isTalking();

        smoothedLevel = 0.0;
        talk.reset (elapsedNow());
        lastVariantIndex = talk_core::kNoVariant;

        if (wasTalking)
            sink.onTalkStateChanged (false);

        sink.onLevelUpdate (smoothedLevel);

        idle.setSuspended (false);
        idle.setFrameCount (config.getIdleFrames().size());
    }
    else if (framesChanged)
    {
        const int keep = idle.getCurrentIndex();
        idle.setFrameCount (config.getIdleFrames().size());
        idle.setCurrentIndex (keep);
    }

    emitCurrentImage();
}

void TalkEngine::pollOnce (double elapsedSec)
{
    if (faulted)
        return;

    try
    {
        const double raw = sampler->readLatest();
        smoothedLevel = talk_core::smoothLevel (smoothedLevel, raw);
        sink.onLevelUpdate (smoothedLevel);

        if (talk.isTalking())
            refreshVariant (false);

        if (talk.update (smoothedLevel, elapsedSec))
            handleTransition();
    }
    catch (const std::exception& e)
    {
        handlePollFault (e.what());
    }
    catch (...)
    {
        handlePollFault ("unknown exception during poll");
    }
}

// Single notify-and-disable: keep the last visual state, no retry.
void TalkEngine::handlePollFault (const juce::String& message)
{
    stopTimer();
    faulted = true;

    juce::Logger::writeToLog ("engine: poll fault, polling stopped: " + message);
    sink.onEngineFault (message);
}

void TalkEngine::shutdown() noexcept
{
    stopTimer();
    idle.stop();

    if (sampler != nullptr)
    {
        sampler->stop();
        sampler->close();
    }
}

void TalkEngine::timerCallback()
{
    pollOnce (elapsedNow());
}

void TalkEngine::handleTransition()
{
    const bool talking = talk.isTalking();
    DBG ("TalkEngine: " << (talking ? "talking" : "idle") << " at level " << smoothedLevel);

    sink.onTalkStateChanged (talking);

    if (talking)
    {
        idle.setSuspended (true);
        refreshVariant (true);
    }
    else
    {
        idle.setSuspended (false);
        sink.onIdleFrameChanged (idleImageAt (idle.getCurrentIndex()));
    }
}

// Only meaningful while talking; the cached index suppresses redundant swaps.
void TalkEngine::refreshVariant (bool force)
{
    const int index = talk_core::selectTier (config.getTalkVariants(), smoothedLevel);
    if (! force && index == lastVariantIndex)
        return;

    DBG ("TalkEngine: variant " << lastVariantIndex << " -> " << index);
    lastVariantIndex = index;
    sink.onVariantChanged (variantImageAt (index));
}

void TalkEngine::emitCurrentImage()
{
    if (talk.isTalking())
        refreshVariant (true);
    else
        sink.onIdleFrameChanged (idleImageAt (idle.getCurrentIndex()));
}

ImageHandle TalkEngine::idleImageAt (int index) const
{
    const auto& frames = config.getIdleFrames();
    if (frames.isEmpty())
        return {};

    return frames[index % frames.size()];
}

ImageHandle TalkEngine::variantImageAt (int index) const
{
    const auto& variants = config.getTalkVariants();
    if (index == talk_core::kNoVariant || index >= (int) variants.size())
        return config.getTalkImage();

    return variants[(size_t) index].image;
}

double TalkEngine::elapsedNow() const noexcept
{
    return juce::Time::getMillisecondCounterHiRes() * 0.001 - clockOriginSec;
}
