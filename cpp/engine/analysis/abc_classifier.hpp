#pragma once
/*
================================================================================
Analysis: ABC Classifier
FILE: cpp/engine/analysis/abc_classifier.hpp

Purpose:
  Rank items by consumption value and assign ABC tiers.

Algorithm:
  1) Stable sort by amount, descending (equal amounts keep input order).
  2) total = sum(amount); share_of_total_pct = amount / total * 100
     (0 when total is 0).
  3) Walk the sorted list with cumulative_before = share of all PRECEDING items:
       cumulative_before <  a_cutoff  -> A
       cumulative_before <  b_cutoff  -> B
       otherwise                      -> C
     then cumulative_share_pct = cumulative_before + share_of_total_pct.

Consequences:
  - The first (largest) item is always A, even if it alone is 100%.
  - Cutoffs are exclusive: cumulative_before == 80 is B, == 95 is C.

Contract:
  - Input is never modified; output is a fresh vector in sorted order.
  - No validation of amounts (negative values are classified mechanically).
================================================================================
*/

#include "engine/core/inventory.hpp"
#include "engine/core/settings.hpp"

namespace abcven {

// Tier for an item given the cumulative share of the items before it.
Tier tier_for_cumulative_before(double cumulative_before_pct,
                                const TierThresholds& th = TierThresholds()) noexcept;

// Classify with the standard 80/95 cutoffs. Never throws for finite input
// (beyond std::bad_alloc).
ClassifiedItems classify(const Items& items);

// Classify with explicit cutoffs. Throws ValidationError if th is invalid.
ClassifiedItems classify(const Items& items, const TierThresholds& th);

}  // namespace abcven
