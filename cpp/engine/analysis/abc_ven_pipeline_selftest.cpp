/*
  ABC/VEN Pipeline + Settings Selftest

  Objective
  ---------
    1) run_abc_ven bundles classifier output and all four roll-ups consistently.
    2) top_item() is the highest-value item (none for an empty batch).
    3) Settings validation rejects nonsensical values.
    4) Log level names parse case-insensitively.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/analysis/abc_ven_pipeline.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"

namespace abcven {
namespace {

static int g_fail_count = 0;

void check(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

template <typename Fn>
bool throws_validation(Fn&& fn) {
  try {
    fn();
  } catch (const ValidationError&) {
    return true;
  }
  return false;
}

Items sample_items() {
  Items v;
  const struct { int code; double amount; Criticality c; } rows[] = {
      {10, 300.0, Criticality::Essential},
      {11, 5000.0, Criticality::Vital},
      {12, 1200.0, Criticality::Vital},
      {13, 80.0, Criticality::NonEssential},
      {14, 420.0, Criticality::Essential},
  };
  for (const auto& r : rows) {
    Item it;
    it.code = r.code;
    it.name = "Drug " + std::to_string(r.code);
    it.unit = "amp.";
    it.quantity = 1.0;
    it.amount = r.amount;
    it.criticality = r.c;
    v.push_back(it);
  }
  return v;
}

void test_pipeline_bundle() {
  const auto r = run_abc_ven(sample_items());

  check(r.total_count == 5, "pipeline: total_count");
  check(std::fabs(r.total_amount - 7000.0) < 1e-9, "pipeline: total_amount");
  check(r.items.size() == 5 && r.items.front().item.code == 11, "pipeline: items sorted by amount");

  const auto top = r.top_item();
  check(top.has_value() && top->item.code == 11 && top->tier == Tier::A, "pipeline: top item is code 11, tier A");

  std::size_t n = 0;
  for (const auto& row : r.by_tier) n += row.stat.count;
  check(n == r.total_count, "pipeline: tier summary covers every item");

  // Sorted 5000,1200,420,300,80; preceding cumulative 0, 71.4, 88.6, 94.6, 98.9.
  check(r.by_tier[0].stat.count == 2 && r.by_tier[1].stat.count == 2 && r.by_tier[2].stat.count == 1,
        "pipeline: tier counts 2,2,1");
  check(r.matrix.at(Tier::A, Criticality::Vital).count == 2, "pipeline: matrix A/V");
  check(std::fabs(r.conditional.at(Tier::B, Criticality::Essential).percent_count - 100.0) < 1e-9,
        "pipeline: conditional B/E is all of B");
}

void test_pipeline_empty() {
  const auto r = run_abc_ven(Items{});
  check(r.items.empty() && r.total_count == 0 && r.total_amount == 0.0, "pipeline: empty batch");
  check(!r.top_item().has_value(), "pipeline: empty batch has no top item");
}

void test_pipeline_custom_settings() {
  AnalysisSettings s = AnalysisSettings::defaults();
  s.thresholds.a_cutoff_pct = 70.0;
  s.thresholds.b_cutoff_pct = 90.0;
  const auto r = run_abc_ven(sample_items(), s);
  // before: 0 A, 71.4 B, 88.6 B, 94.6 C, 98.9 C
  check(r.by_tier[0].stat.count == 1 && r.by_tier[1].stat.count == 2 && r.by_tier[2].stat.count == 2,
        "pipeline: custom cutoffs 70/90 -> 1,2,2");

  s.thresholds.b_cutoff_pct = 60.0;
  check(throws_validation([&] { (void)run_abc_ven(sample_items(), s); }),
        "pipeline: invalid cutoffs rejected");
}

void test_settings_validation() {
  check(!throws_validation([] { AnalysisSettings::defaults().validate_or_throw(); }),
        "settings: defaults are valid");

  check(throws_validation([] {
          TierThresholds t;
          t.a_cutoff_pct = 0.0;
          t.validate_or_throw();
        }),
        "settings: a_cutoff 0 rejected");
  check(throws_validation([] {
          TierThresholds t;
          t.b_cutoff_pct = 100.5;
          t.validate_or_throw();
        }),
        "settings: b_cutoff above 100 rejected");
  check(throws_validation([] {
          RecordSourceSettings r;
          r.header_lines = -1;
          r.validate_or_throw();
        }),
        "settings: negative header_lines rejected");
  check(throws_validation([] {
          RecordSourceSettings r;
          r.min_columns = 5;
          r.validate_or_throw();
        }),
        "settings: min_columns below 6 rejected");
  check(throws_validation([] {
          ExportSettings e;
          e.delimiter = '"';
          e.validate_or_throw();
        }),
        "settings: quote delimiter rejected");
  check(throws_validation([] {
          ExportSettings e;
          e.precision = 13;
          e.validate_or_throw();
        }),
        "settings: precision 13 rejected");
}

void test_log_level_names() {
  LogLevel lvl = LogLevel::INFO;
  check(parse_log_level("DEBUG", &lvl) && lvl == LogLevel::DEBUG, "logging: DEBUG");
  check(parse_log_level("warn", &lvl) && lvl == LogLevel::WARN, "logging: warn");
  check(parse_log_level("Warning", &lvl) && lvl == LogLevel::WARN, "logging: Warning");
  check(parse_log_level("error", &lvl) && lvl == LogLevel::ERROR, "logging: error");
  check(!parse_log_level("loud", &lvl) && lvl == LogLevel::ERROR, "logging: unknown name leaves level untouched");
  check(!parse_log_level("info", nullptr), "logging: null out rejected");
}

}  // namespace
}  // namespace abcven

int main() {
  using namespace abcven;

  // Keep stdout quiet; pipeline INFO lines go to stderr with the check output.
  set_log_stderr_only(true);

  test_pipeline_bundle();
  test_pipeline_empty();
  test_pipeline_custom_settings();
  test_settings_validation();
  test_log_level_names();

  if (g_fail_count != 0) {
    std::cerr << "\nabc_ven_pipeline_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nabc_ven_pipeline_selftest: all checks passed\n";
  return 0;
}
