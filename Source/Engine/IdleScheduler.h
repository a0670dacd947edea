#pragma once
#include <juce_events/juce_events.h>
#include <functional>

// Idle frame cadence on the message thread.
//
// Each firing advances one frame and then draws its own next delay from the
// current bounds, so timing changes apply from the next scheduled tick and never
// cut short a tick already in flight.
class IdleScheduler final : private juce::Timer
{
public:
    IdleScheduler();
    ~IdleScheduler() override;

    // Called with the new frame index after every advance.
    std::function<void (int frameIndex)> onFrameAdvanced;

    // Resets the index to 0 and (re)starts or stops the schedule.
    void setFrameCount (int numFrames);

    // Bounds are expected pre-clamped (AvatarConfig); a running timer keeps its current delay.
    void setTiming (double minSec, double maxSec, bool randomOrder);

    // Suspended while a talk image is shown. Resuming draws a fresh interval.
    void setSuspended (bool shouldSuspend);

    // Restores a carried-forward index without rescheduling.
    void setCurrentIndex (int index) noexcept;

    void setRandomSeed (juce::int64 seed) noexcept { rng.setSeed (seed); }

    // One cadence step: advance, notify, schedule the next tick.
    void advance();

    void stop() noexcept;

    int getCurrentIndex() const noexcept       { return currentIndex; }
    int getFrameCount() const noexcept         { return frameCount; }
    bool isScheduled() const noexcept          { return isTimerRunning(); }
    int getScheduledIntervalMs() const noexcept { return scheduledMs; }

private:
    void timerCallback() override;
    void scheduleNext();

    int frameCount = 0;
    int currentIndex = 0;
    bool suspended = false;

    bool randomOrder = false;
    double intervalMinSec = 0.2;
    double intervalMaxSec = 0.6;
    int scheduledMs = 0;

    juce::Random rng;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR (IdleScheduler)
};
