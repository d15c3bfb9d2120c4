#pragma once
/*
================================================================================
Analysis: ABC/VEN Pipeline
FILE: cpp/engine/analysis/abc_ven_pipeline.hpp

Purpose:
  One call that runs the classifier and all four aggregations and hands back a
  single value bundle for exporters and tools.

Notes:
  - Pure orchestration: no state survives the call.
  - Logs one INFO line per stage (component "abc_ven").
================================================================================
*/

#include "engine/core/inventory.hpp"
#include "engine/core/settings.hpp"

#include <cstddef>
#include <optional>

namespace abcven {

struct AbcVenReport {
  ClassifiedItems items;  // sorted by amount, descending

  std::size_t total_count = 0;
  double total_amount = 0.0;

  TierSummary by_tier{};
  CriticalitySummary by_criticality{};
  TierCriticalityGrid matrix{};
  TierCriticalityGrid conditional{};

  // Highest-value item, if any.
  std::optional<ClassifiedItem> top_item() const {
    if (items.empty()) return std::nullopt;
    return items.front();
  }
};

// Standard cutoffs.
AbcVenReport run_abc_ven(const Items& items);

// Explicit cutoffs; throws ValidationError if settings.thresholds is invalid.
AbcVenReport run_abc_ven(const Items& items, const AnalysisSettings& settings);

}  // namespace abcven
