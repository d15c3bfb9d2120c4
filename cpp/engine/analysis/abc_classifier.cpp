/*
================================================================================
Analysis: ABC Classifier Implementation
FILE: cpp/engine/analysis/abc_classifier.cpp
================================================================================
*/

#include "engine/analysis/abc_classifier.hpp"

#include "engine/analysis/abc_ven_aggregate.hpp"

#include <algorithm>
#include <utility>

namespace abcven {

Tier tier_for_cumulative_before(double cumulative_before_pct, const TierThresholds& th) noexcept {
  if (cumulative_before_pct < th.a_cutoff_pct) return Tier::A;
  if (cumulative_before_pct < th.b_cutoff_pct) return Tier::B;
  return Tier::C;
}

static ClassifiedItems classify_unchecked(const Items& items, const TierThresholds& th) {
  ClassifiedItems out;
  if (items.empty()) return out;

  Items sorted(items);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const Item& a, const Item& b) { return a.amount > b.amount; });

  double total = 0.0;
  for (const auto& it : sorted) total += it.amount;

  out.reserve(sorted.size());
  double cumulative_before = 0.0;

  for (auto& it : sorted) {
    ClassifiedItem ci;
    ci.share_of_total_pct = percent_of(it.amount, total);

    // Classify on the preceding cumulative share; advance only afterwards.
    ci.tier = tier_for_cumulative_before(cumulative_before, th);
    ci.cumulative_share_pct = cumulative_before + ci.share_of_total_pct;
    cumulative_before = ci.cumulative_share_pct;

    ci.item = std::move(it);
    out.push_back(std::move(ci));
  }

  return out;
}

ClassifiedItems classify(const Items& items) {
  return classify_unchecked(items, TierThresholds());
}

ClassifiedItems classify(const Items& items, const TierThresholds& th) {
  th.validate_or_throw();
  return classify_unchecked(items, th);
}

}  // namespace abcven
