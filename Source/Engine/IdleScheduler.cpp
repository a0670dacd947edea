#include "IdleScheduler.h"
#include "talk_core/idle_cadence.h"

IdleScheduler::IdleScheduler()
    : intervalMinSec (talk_core::kIdleIntervalMinDefault),
      intervalMaxSec (talk_core::kIdleIntervalMaxDefault)
{
}

IdleScheduler::~IdleScheduler()
{
    stopTimer();
}

void IdleScheduler::setFrameCount (int numFrames)
{
    frameCount = juce::jmax (0, numFrames);
    currentIndex = 0;
    scheduleNext();
}

void IdleScheduler::setTiming (double minSec, double maxSec, bool shouldRandomise)
{
    intervalMinSec = minSec;
    intervalMaxSec = juce::jmax (minSec, maxSec);
    randomOrder = shouldRandomise;

    // Already running: leave the in-flight delay alone.
    if (! isTimerRunning() && talk_core::idleShouldRun (frameCount, suspended))
        scheduleNext();
}

void IdleScheduler::setSuspended (bool shouldSuspend)
{
    if (suspended == shouldSuspend)
        return;

    suspended = shouldSuspend;
    scheduleNext();
}

void IdleScheduler::setCurrentIndex (int index) noexcept
{
    currentIndex = (frameCount > 0) ? juce::jlimit (0, frameCount - 1, index) : 0;
}

void IdleScheduler::stop() noexcept
{
    stopTimer();
    scheduledMs = 0;
}

void IdleScheduler::advance()
{
    if (! talk_core::idleShouldRun (frameCount, suspended))
    {
        stop();
        return;
    }

    currentIndex = talk_core::nextIdleIndex (currentIndex, frameCount, randomOrder, rng.nextDouble());

    if (onFrameAdvanced)
        onFrameAdvanced (currentIndex);

    scheduleNext();
}

void IdleScheduler::scheduleNext()
{
    if (! talk_core::idleShouldRun (frameCount, suspended))
    {
        stop();
        return;
    }

    const double sec = talk_core::drawIntervalSec (intervalMinSec, intervalMaxSec, rng.nextDouble());
    scheduledMs = juce::jmax (1, talk_core::intervalToMs (sec));
    startTimer (scheduledMs);
}

void IdleScheduler::timerCallback()
{
    advance();
}
