#pragma once

#include <algorithm>
#include <vector>

#include "talk_core/talk_core.h"

namespace talk_core
{
    // Talk variant tiers
    //
    // Entries are any type with a `double threshold` member. The list is kept in
    // ascending threshold order with a stable sort so that equal thresholds keep
    // their load order; the later of a tied group is the one that gets selected.

    template <typename Entry>
    void sortTiers (std::vector<Entry>& tiers)
    {
        std::stable_sort (tiers.begin(), tiers.end(),
                          [] (const Entry& a, const Entry& b) { return a.threshold < b.threshold; });
    }

    template <typename Entry>
    bool tiersAreSorted (const std::vector<Entry>& tiers) noexcept
    {
        return std::is_sorted (tiers.begin(), tiers.end(),
                               [] (const Entry& a, const Entry& b) { return a.threshold < b.threshold; });
    }

    // Index of the last tier whose threshold <= level, or kNoVariant.
    // Equality qualifies. Requires an ascending list.
    template <typename Entry>
    int selectTier (const std::vector<Entry>& tiers, double level) noexcept
    {
        const auto it = std::upper_bound (tiers.begin(), tiers.end(), level,
                                          [] (double lv, const Entry& e) { return lv < e.threshold; });

        return (int) (it - tiers.begin()) - 1;
    }
}
