/*
  ABC Classifier Selftest

  Objective
  ---------
  Framework-free checks for the classifier:
    1) Output is sorted by amount (descending, stable), input untouched.
    2) share_of_total / cumulative_share arithmetic.
    3) Tier cutoffs are evaluated on the cumulative share BEFORE each item,
       with exclusive bounds at 80 and 95.
    4) Degenerate batches (empty, zero total) never produce NaN.

  Expected use
  ------------
      ./abc_classifier_selftest
  Non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/analysis/abc_classifier.hpp"
#include "engine/core/errors.hpp"

namespace abcven {
namespace {

static int g_fail_count = 0;

void fail(std::string_view msg) {
  ++g_fail_count;
  std::cerr << "[FAIL] " << msg << "\n";
}

void pass(std::string_view msg) {
  std::cerr << "[ OK ] " << msg << "\n";
}

void expect_true(bool v, std::string_view msg) {
  if (!v) fail(msg);
  else pass(msg);
}

void expect_near(double got, double exp, double tol, std::string_view msg) {
  if (!(std::fabs(got - exp) <= tol)) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << got << "\n";
  } else {
    pass(msg);
  }
}

void expect_tiers(const ClassifiedItems& got, const std::string& exp, std::string_view msg) {
  std::string s;
  for (const auto& ci : got) s += to_char(ci.tier);
  if (s != exp) {
    fail(msg);
    std::cerr << "  expected " << exp << ", got " << s << "\n";
  } else {
    pass(msg);
  }
}

Item make_item(int code, double amount, Criticality c = Criticality::Vital) {
  Item it;
  it.code = code;
  it.name = "Item " + std::to_string(code);
  it.unit = "pk";
  it.quantity = 10.0;
  it.amount = amount;
  it.criticality = c;
  return it;
}

Items make_items(const std::vector<double>& amounts) {
  Items v;
  int code = 1;
  for (double a : amounts) v.push_back(make_item(code++, a));
  return v;
}

void test_sorts_descending_without_touching_input() {
  const Items in{make_item(1, 100), make_item(2, 300), make_item(3, 200)};
  const auto out = classify(in);

  expect_true(out.size() == 3, "sort: output keeps every item");
  expect_true(out[0].item.code == 2 && out[1].item.code == 3 && out[2].item.code == 1,
              "sort: amounts descending");
  expect_true(in[0].code == 1 && in[1].code == 2 && in[2].code == 3,
              "sort: input order unchanged");
}

void test_equal_amounts_keep_input_order() {
  const Items in{make_item(7, 50), make_item(3, 50), make_item(9, 80), make_item(1, 50)};
  const auto out = classify(in);

  expect_true(out[0].item.code == 9, "stable: largest first");
  expect_true(out[1].item.code == 7 && out[2].item.code == 3 && out[3].item.code == 1,
              "stable: ties keep input order");
}

void test_shares_and_cumulative() {
  const auto out = classify(make_items({50, 30, 20}));

  expect_near(out[0].share_of_total_pct, 50.0, 1e-9, "share: 50");
  expect_near(out[1].share_of_total_pct, 30.0, 1e-9, "share: 30");
  expect_near(out[2].share_of_total_pct, 20.0, 1e-9, "share: 20");
  expect_near(out[0].cumulative_share_pct, 50.0, 1e-9, "cumulative: 50");
  expect_near(out[1].cumulative_share_pct, 80.0, 1e-9, "cumulative: 80");
  expect_near(out[2].cumulative_share_pct, 100.0, 1e-9, "cumulative: 100");
  expect_tiers(out, "AAB", "tiers: preceding 0,50,80 -> A,A,B");
}

void test_fractional_amounts_sum_to_100() {
  const auto out = classify(make_items({33.33, 33.33, 33.34}));
  double sum = 0.0;
  for (const auto& ci : out) sum += ci.share_of_total_pct;
  expect_near(sum, 100.0, 1e-5, "fractional: shares sum to 100");
  expect_near(out.back().cumulative_share_pct, 100.0, 1e-5, "fractional: last cumulative is 100");
}

void test_threshold_exclusivity() {
  expect_tiers(classify(make_items({70, 15, 10, 5})), "AABC",
               "cutoffs: preceding 0,70,85,95 -> A,A,B,C");
  expect_tiers(classify(make_items({80, 10, 5, 5})), "ABBC",
               "cutoffs: exactly 80 before -> B, exactly 95 before -> C");
  expect_tiers(classify(make_items({96, 2, 1, 1})), "ACCC",
               "cutoffs: everything after 96% is C");
}

void test_dominant_item_is_always_a() {
  expect_tiers(classify(make_items({90, 10})), "AB", "dominant: 90 then 10 -> A,B");

  const auto single = classify(make_items({100}));
  expect_tiers(single, "A", "dominant: lone item is A");
  expect_near(single[0].share_of_total_pct, 100.0, 1e-12, "dominant: lone share is 100");
  expect_near(single[0].cumulative_share_pct, 100.0, 1e-12, "dominant: lone cumulative is 100");
}

void test_cumulative_non_decreasing() {
  const auto out = classify(make_items({5, 120, 7.5, 0, 33, 33, 1000, 2.25, 64}));
  bool mono = true;
  for (std::size_t i = 1; i < out.size(); ++i) {
    if (out[i].cumulative_share_pct < out[i - 1].cumulative_share_pct) mono = false;
    if (out[i].item.amount > out[i - 1].item.amount) mono = false;
  }
  expect_true(mono, "monotone: amounts non-increasing, cumulative non-decreasing");
  expect_near(out.back().cumulative_share_pct, 100.0, 1e-5, "monotone: ends at 100");
}

void test_degenerate_batches() {
  expect_true(classify(Items{}).empty(), "empty: no output");

  const auto zeros = classify(make_items({0, 0, 0}));
  bool all_zero = zeros.size() == 3;
  for (const auto& ci : zeros) {
    if (ci.share_of_total_pct != 0.0 || ci.cumulative_share_pct != 0.0) all_zero = false;
  }
  expect_true(all_zero, "zero total: shares are 0, not NaN");
  expect_tiers(zeros, "AAA", "zero total: cumulative stays 0 so every item is A");
}

void test_custom_thresholds() {
  TierThresholds th;
  th.a_cutoff_pct = 50.0;
  th.b_cutoff_pct = 90.0;
  expect_tiers(classify(make_items({50, 30, 15, 5}), th), "ABBC",
               "custom: 50/90 cutoffs applied");

  expect_true(tier_for_cumulative_before(79.999) == Tier::A, "tier_for: 79.999 -> A");
  expect_true(tier_for_cumulative_before(80.0) == Tier::B, "tier_for: 80 -> B");
  expect_true(tier_for_cumulative_before(94.999) == Tier::B, "tier_for: 94.999 -> B");
  expect_true(tier_for_cumulative_before(95.0) == Tier::C, "tier_for: 95 -> C");

  TierThresholds bad;
  bad.a_cutoff_pct = 95.0;
  bad.b_cutoff_pct = 80.0;
  bool threw = false;
  try {
    (void)classify(make_items({1, 2}), bad);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "custom: inverted cutoffs rejected");
}

}  // namespace
}  // namespace abcven

int main() {
  using namespace abcven;

  test_sorts_descending_without_touching_input();
  test_equal_amounts_keep_input_order();
  test_shares_and_cumulative();
  test_fractional_amounts_sum_to_100();
  test_threshold_exclusivity();
  test_dominant_item_is_always_a();
  test_cumulative_non_decreasing();
  test_degenerate_batches();
  test_custom_thresholds();

  if (g_fail_count != 0) {
    std::cerr << "\nabc_classifier_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nabc_classifier_selftest: all checks passed\n";
  return 0;
}
