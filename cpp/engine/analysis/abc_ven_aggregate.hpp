#pragma once
/*
================================================================================
Analysis: ABC/VEN Aggregations
FILE: cpp/engine/analysis/abc_ven_aggregate.hpp

Purpose:
  Four independent roll-ups over a classified batch:
    1) summarize_by_tier              - rows A, B, C (always all three)
    2) summarize_by_criticality       - rows V, E, N (always all three)
    3) build_matrix                   - 3x3 tier x criticality, % of GRAND total
    4) build_conditional_distribution - 3x3 tier x criticality, % of TIER subtotal

Rules:
  - Every call recomputes from scratch; inputs are read-only.
  - Zero denominator -> 0 percent (never NaN/Inf, never a fault). This applies
    to empty batches, zero-amount batches and empty tiers alike.
  - In the conditional distribution each non-empty tier row sums to 100% of its
    count and 100% of its amount. A non-positive amount subtotal gives 0% amount
    for that row.
================================================================================
*/

#include "engine/core/inventory.hpp"

namespace abcven {

// part / whole * 100, or 0 when whole == 0.
double percent_of(double part, double whole) noexcept;

// Sum of amounts over the batch.
double total_amount(const ClassifiedItems& items) noexcept;

TierSummary summarize_by_tier(const ClassifiedItems& items) noexcept;

CriticalitySummary summarize_by_criticality(const ClassifiedItems& items) noexcept;

TierCriticalityGrid build_matrix(const ClassifiedItems& items) noexcept;

TierCriticalityGrid build_conditional_distribution(const ClassifiedItems& items) noexcept;

}  // namespace abcven
