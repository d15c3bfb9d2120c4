/*
================================================================================
Analysis: ABC/VEN Pipeline Implementation
FILE: cpp/engine/analysis/abc_ven_pipeline.cpp
================================================================================
*/

#include "engine/analysis/abc_ven_pipeline.hpp"

#include "engine/analysis/abc_classifier.hpp"
#include "engine/analysis/abc_ven_aggregate.hpp"
#include "engine/core/logging.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace abcven {

static constexpr const char* kComponent = "abc_ven";

static AbcVenReport aggregate_all(ClassifiedItems classified) {
  AbcVenReport r;
  r.items = std::move(classified);
  r.total_count = r.items.size();
  r.total_amount = total_amount(r.items);

  r.by_tier = summarize_by_tier(r.items);
  r.by_criticality = summarize_by_criticality(r.items);
  r.matrix = build_matrix(r.items);
  r.conditional = build_conditional_distribution(r.items);

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2)
      << "classified " << r.total_count << " items, total amount " << r.total_amount;
  log(LogLevel::INFO, kComponent, oss.str());

  std::ostringstream tiers;
  tiers << std::fixed << std::setprecision(2);
  for (const auto& row : r.by_tier) {
    tiers << to_char(row.tier) << "=" << row.stat.count
          << " (" << row.stat.percent_amount << "% of amount) ";
  }
  log(LogLevel::INFO, kComponent, tiers.str());

  if (r.total_count > 0 && r.total_amount == 0.0) {
    log(LogLevel::WARN, kComponent, "total amount is zero; all shares reported as 0%");
  }

  return r;
}

AbcVenReport run_abc_ven(const Items& items) {
  log(LogLevel::DEBUG, kComponent, "classifying with default cutoffs 80/95");
  return aggregate_all(classify(items));
}

AbcVenReport run_abc_ven(const Items& items, const AnalysisSettings& settings) {
  std::ostringstream oss;
  oss << "classifying with cutoffs " << settings.thresholds.a_cutoff_pct
      << "/" << settings.thresholds.b_cutoff_pct;
  log(LogLevel::DEBUG, kComponent, oss.str());
  return aggregate_all(classify(items, settings.thresholds));
}

}  // namespace abcven
