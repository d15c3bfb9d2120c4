/*
================================================================================
Analysis: ABC/VEN Aggregations Implementation
FILE: cpp/engine/analysis/abc_ven_aggregate.cpp
================================================================================
*/

#include "engine/analysis/abc_ven_aggregate.hpp"

#include <array>
#include <cstddef>

namespace abcven {

double percent_of(double part, double whole) noexcept {
  if (whole == 0.0) return 0.0;
  return part / whole * 100.0;
}

double total_amount(const ClassifiedItems& items) noexcept {
  double total = 0.0;
  for (const auto& ci : items) total += ci.item.amount;
  return total;
}

static inline void add_item(CategoryStat& s, const ClassifiedItem& ci) noexcept {
  ++s.count;
  s.amount += ci.item.amount;
}

static inline void finalize_percentages(CategoryStat& s, double count_whole, double amount_whole) noexcept {
  s.percent_count = percent_of(static_cast<double>(s.count), count_whole);
  s.percent_amount = percent_of(s.amount, amount_whole);
}

TierSummary summarize_by_tier(const ClassifiedItems& items) noexcept {
  TierSummary out{};
  for (std::size_t i = 0; i < kTierCount; ++i) out[i].tier = kTiers[i];

  for (const auto& ci : items) add_item(out[index_of(ci.tier)].stat, ci);

  const double n = static_cast<double>(items.size());
  const double total = total_amount(items);
  for (auto& row : out) finalize_percentages(row.stat, n, total);
  return out;
}

CriticalitySummary summarize_by_criticality(const ClassifiedItems& items) noexcept {
  CriticalitySummary out{};
  for (std::size_t i = 0; i < kCriticalityCount; ++i) out[i].criticality = kCriticalities[i];

  for (const auto& ci : items) add_item(out[index_of(ci.item.criticality)].stat, ci);

  const double n = static_cast<double>(items.size());
  const double total = total_amount(items);
  for (auto& row : out) finalize_percentages(row.stat, n, total);
  return out;
}

TierCriticalityGrid build_matrix(const ClassifiedItems& items) noexcept {
  TierCriticalityGrid g{};
  for (const auto& ci : items) add_item(g.at(ci.tier, ci.item.criticality), ci);

  // Relative to the grand total, not per row.
  const double n = static_cast<double>(items.size());
  const double total = total_amount(items);
  for (auto& row : g.cells) {
    for (auto& cell : row) finalize_percentages(cell, n, total);
  }
  return g;
}

TierCriticalityGrid build_conditional_distribution(const ClassifiedItems& items) noexcept {
  TierCriticalityGrid g{};
  std::array<std::size_t, kTierCount> group_count{};
  std::array<double, kTierCount> group_amount{};

  for (const auto& ci : items) {
    add_item(g.at(ci.tier, ci.item.criticality), ci);
    ++group_count[index_of(ci.tier)];
    group_amount[index_of(ci.tier)] += ci.item.amount;
  }

  // Each row is normalized by its own tier subtotal; an empty tier stays all-zero.
  // A non-positive amount subtotal yields 0% amount shares for the whole row.
  for (Tier t : kTiers) {
    const std::size_t ti = index_of(t);
    const double amount_whole = group_amount[ti] > 0.0 ? group_amount[ti] : 0.0;
    for (auto& cell : g.cells[ti]) {
      finalize_percentages(cell, static_cast<double>(group_count[ti]), amount_whole);
    }
  }
  return g;
}

}  // namespace abcven
