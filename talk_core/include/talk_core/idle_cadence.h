#pragma once

#include <cmath>

#include "talk_core/talk_core.h"

namespace talk_core
{
    // Idle cadence math. Randomness is injected as a uniform draw u01 in [0, 1)
    // so the schedule is reproducible under a seeded generator.

    inline double drawIntervalSec (double minSec, double maxSec, double u01) noexcept
    {
        if (maxSec < minSec) maxSec = minSec;
        return minSec + (maxSec - minSec) * u01;
    }

    inline int intervalToMs (double sec) noexcept
    {
        return (int) std::lround (sec * 1000.0);
    }

    // Next idle index. Random order may repeat the current index.
    inline int nextIdleIndex (int current, int frameCount, bool randomOrder, double u01) noexcept
    {
        if (frameCount <= 0)
            return 0;

        if (randomOrder)
        {
            const int pick = (int) std::floor (u01 * (double) frameCount);
            return pick < frameCount ? pick : frameCount - 1;
        }

        return (current + 1) % frameCount;
    }

    // The schedule only runs with something to animate and nothing covering it.
    inline bool idleShouldRun (int frameCount, bool talking) noexcept
    {
        return frameCount > 1 && ! talking;
    }
}
