#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace talk_core
{
    constexpr const char* kTalkCoreId = "talk_core_v1";

    // Signal domains
    //
    // 1) Sample domain (LoudnessLin):
    //    - Instantaneous RMS of one device buffer, linear amplitude, always > 0 (epsilon floor).
    //
    // 2) Decision domain (SmoothedLin):
    //    - EWMA of LoudnessLin advanced once per poll tick. Thresholds live here.

    constexpr double kRmsEpsilon = 1.0e-6;

    // Level smoother (fixed coefficients, not user-configurable)
    constexpr double kSmoothKeep = 0.7;
    constexpr double kSmoothTake = 0.3;

    // Talk thresholds
    constexpr double kTalkThresholdDefault = 0.03;
    constexpr double kTalkThresholdMin     = 0.001;
    constexpr double kTalkThresholdMax     = 0.5;
    constexpr double kReleaseRatio         = 0.7;   // release = talk * 0.7
    constexpr double kMinDwellSec          = 0.05;

    // Idle cadence bounds (seconds)
    constexpr double kIdleIntervalFloorSec   = 0.05;
    constexpr double kIdleIntervalCeilSec    = 10.0;
    constexpr double kIdleIntervalMinDefault = 0.2;
    constexpr double kIdleIntervalMaxDefault = 0.6;

    // Poll cadence of the cooperative loop
    constexpr int kPollIntervalMs = 60;

    // -1 = no variant qualified, use the default talk image
    constexpr int kNoVariant = -1;

    // Transition audit hooks (TEST-ONLY)
    // Counters for the talk-state machine; compiled out unless the build enables them.

#if defined(TALK_CORE_ENABLE_TRANSITION_AUDIT) && (TALK_CORE_ENABLE_TRANSITION_AUDIT == 1)

    struct TransitionAudit final
    {
        std::uint32_t transitions   = 0;
        std::uint32_t dwellRejected = 0;

        void reset() noexcept
        {
            transitions = 0;
            dwellRejected = 0;
        }
    };

    inline TransitionAudit& transitionAudit() noexcept
    {
        static TransitionAudit a;
        return a;
    }

    inline void auditTransition() noexcept     { ++transitionAudit().transitions; }
    inline void auditDwellRejected() noexcept  { ++transitionAudit().dwellRejected; }

#else

    struct TransitionAudit final
    {
        void reset() noexcept {}
    };

    inline TransitionAudit& transitionAudit() noexcept
    {
        static TransitionAudit a;
        return a;
    }

    inline void auditTransition() noexcept {}
    inline void auditDwellRejected() noexcept {}

#endif

    // Sample domain helpers

    // Root-mean-square of one buffer plus kRmsEpsilon. numSamples must be > 0.
    inline double computeRms (const float* samples, int numSamples) noexcept
    {
        double sumSq = 0.0;
        for (int i = 0; i < numSamples; ++i)
        {
            const double v = (double) samples[i];
            sumSq += v * v;
        }

        return std::sqrt (sumSq / (double) numSamples) + kRmsEpsilon;
    }

    // Decision domain helpers

    // One EWMA step. Non-finite or negative readings count as silence so the
    // result stays a convex combination of two non-negative values.
    inline double smoothLevel (double smoothed, double raw) noexcept
    {
        if (! std::isfinite (raw) || raw < 0.0) raw = 0.0;
        if (! std::isfinite (smoothed) || smoothed < 0.0) smoothed = 0.0;
        return smoothed * kSmoothKeep + raw * kSmoothTake;
    }

    inline double clampTalkThreshold (double th) noexcept
    {
        if (! std::isfinite (th)) return kTalkThresholdDefault;
        return std::clamp (th, kTalkThresholdMin, kTalkThresholdMax);
    }

    inline double releaseThresholdFor (double talkThreshold) noexcept
    {
        return talkThreshold * kReleaseRatio;
    }

    inline double clampIdleIntervalSec (double sec, double fallback) noexcept
    {
        if (! std::isfinite (sec)) sec = fallback;
        return std::clamp (sec, kIdleIntervalFloorSec, kIdleIntervalCeilSec);
    }
}
