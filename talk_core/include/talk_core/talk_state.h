#pragma once

#include <cstdint>

#include "talk_core/talk_core.h"

namespace talk_core
{
    enum class TalkState : std::uint8_t
    {
        Idle    = 0,
        Talking = 1
    };

    // Hysteresis talk/idle decision over the smoothed level.
    //
    // Two orthogonal debounces:
    // - magnitude: rise above talkThreshold, fall below talkThreshold * kReleaseRatio
    // - time: no transition within kMinDwellSec of the previous one
    //
    // Times are seconds on any monotonic base; the machine only looks at differences.
    class TalkStateMachine final
    {
    public:
        explicit TalkStateMachine (double talkThreshold = kTalkThresholdDefault,
                                   double startTimeSec = 0.0) noexcept
            : talkTh (clampTalkThreshold (talkThreshold)),
              lastTransitionSec (startTimeSec)
        {
        }

        // Returns true when this update flipped the state.
        bool update (double smoothed, double nowSec) noexcept
        {
            const bool wantsFlip = (state == TalkState::Idle) ? (smoothed > talkTh)
                                                              : (smoothed < releaseThreshold());
            if (! wantsFlip)
                return false;

            if ((nowSec - lastTransitionSec) <= kMinDwellSec)
            {
                auditDwellRejected();
                return false;
            }

            state = (state == TalkState::Idle) ? TalkState::Talking : TalkState::Idle;
            lastTransitionSec = nowSec;
            auditTransition();
            return true;
        }

        // Takes effect from the next update; never flips on its own.
        void setTalkThreshold (double th) noexcept { talkTh = clampTalkThreshold (th); }

        void reset (double nowSec) noexcept
        {
            state = TalkState::Idle;
            lastTransitionSec = nowSec;
        }

        TalkState getState() const noexcept           { return state; }
        bool isTalking() const noexcept               { return state == TalkState::Talking; }
        double getTalkThreshold() const noexcept      { return talkTh; }
        double releaseThreshold() const noexcept      { return releaseThresholdFor (talkTh); }
        double getLastTransitionSec() const noexcept  { return lastTransitionSec; }

    private:
        TalkState state = TalkState::Idle;
        double talkTh;
        double lastTransitionSec;
    };
}
