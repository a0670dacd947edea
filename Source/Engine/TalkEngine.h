#pragma once
#include <juce_events/juce_events.h>
#include <memory>
#include "talk_core/talk_state.h"
#include "../Config/AvatarConfig.h"
#include "IdleScheduler.h"
#include "LoudnessSampler.h"
#include "RenderSink.h"

// What a live reconfiguration does with in-memory engine state
// (smoothed level, talk state, idle index).
enum class ReconfigurePolicy
{
    CarryState,
    ResetState
};

// Reactive engine: poll -> smooth -> talk state -> variant, plus the idle cadence.
//
// Runs entirely on the message thread. The poll timer and the idle timer interleave
// but never overlap, so no locking exists between them; the sampler's ring is the
// only cross-thread state.
class TalkEngine final : private juce::Timer
{
public:
    TalkEngine (std::unique_ptr<LoudnessSampler> sampler, const AvatarConfig& config, RenderSink& sink);
    ~TalkEngine() override;

    // Emits the initial idle frame and starts the poll and idle timers.
    void start();

    void applyConfiguration (const AvatarConfig& newConfig,
                             ReconfigurePolicy policy = ReconfigurePolicy::CarryState);

    // One poll tick at elapsedSec on the engine clock. Faults are contained here.
    void pollOnce (double elapsedSec);

    // Stop poll timer -> stop idle timer -> stop and close the stream.
    // Every step is idempotent and independent of the others.
    void shutdown() noexcept;

    bool isPolling() const noexcept              { return isTimerRunning(); }
    bool isTalking() const noexcept              { return talk.isTalking(); }
    bool hasFaulted() const noexcept             { return faulted; }
    double getSmoothedLevel() const noexcept     { return smoothedLevel; }
    int getSelectedVariantIndex() const noexcept { return lastVariantIndex; }
    const AvatarConfig& getConfig() const noexcept { return config; }
    IdleScheduler& getIdleScheduler() noexcept   { return idle; }

private:
    void timerCallback() override;

    void handleTransition();
    void handlePollFault (const juce::String& message);
    void refreshVariant (bool force);
    void emitCurrentImage();

    ImageHandle idleImageAt (int index) const;
    ImageHandle variantImageAt (int index) const;
    double elapsedNow() const noexcept;

    std::unique_ptr<LoudnessSampler> sampler;
    AvatarConfig config;
    RenderSink& sink;

    double clockOriginSec = 0.0;
    double smoothedLevel = 0.0;
    talk_core::TalkStateMachine talk;
    int lastVariantIndex = talk_core::kNoVariant;

    IdleScheduler idle;

    bool faulted = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (TalkEngine)
};
