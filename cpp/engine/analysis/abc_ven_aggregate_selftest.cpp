/*
  ABC/VEN Aggregation Selftest

  Objective
  ---------
  Framework-free checks for the four roll-ups:
    1) Summaries always expose all three rows, in fixed order, zero-filled.
    2) Summary totals round-trip to the batch count/amount.
    3) The matrix is relative to the grand total (all 9 cells sum to 100%).
    4) The conditional distribution is relative to each tier (rows sum to 100%),
       and an empty tier yields zero cells instead of NaN.
    5) Empty batches give well-defined zero structures.

  Expected use
  ------------
      ./abc_ven_aggregate_selftest
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>

#include "engine/analysis/abc_classifier.hpp"
#include "engine/analysis/abc_ven_aggregate.hpp"

namespace abcven {
namespace {

static int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

bool near(double a, double b, double tol = 1e-9) {
  return std::fabs(a - b) <= tol;
}

bool is_zero_stat(const CategoryStat& s) {
  return s.count == 0 && s.amount == 0.0 && s.percent_count == 0.0 && s.percent_amount == 0.0;
}

ClassifiedItem make_classified(int code, double amount, Tier t, Criticality c) {
  ClassifiedItem ci;
  ci.item.code = code;
  ci.item.name = "Item " + std::to_string(code);
  ci.item.amount = amount;
  ci.item.criticality = c;
  ci.tier = t;
  return ci;
}

// A: 2V + 1E (amounts 500, 200, 100), B: 1V + 1N (100, 60), C: 1E (40). Total 1000.
ClassifiedItems sample_batch() {
  return ClassifiedItems{
      make_classified(1, 500.0, Tier::A, Criticality::Vital),
      make_classified(2, 200.0, Tier::A, Criticality::Vital),
      make_classified(3, 100.0, Tier::A, Criticality::Essential),
      make_classified(4, 100.0, Tier::B, Criticality::Vital),
      make_classified(5, 60.0, Tier::B, Criticality::NonEssential),
      make_classified(6, 40.0, Tier::C, Criticality::Essential),
  };
}

void test_percent_of_zero_denominator() {
  expect_true(percent_of(5.0, 0.0) == 0.0, "percent_of: zero denominator -> 0");
  expect_true(percent_of(0.0, 0.0) == 0.0, "percent_of: 0/0 -> 0");
  expect_true(near(percent_of(1.0, 4.0), 25.0), "percent_of: 1/4 -> 25");
}

void test_tier_summary() {
  const auto s = summarize_by_tier(sample_batch());

  expect_true(s[0].tier == Tier::A && s[1].tier == Tier::B && s[2].tier == Tier::C,
              "tier summary: order A,B,C");
  expect_true(s[0].stat.count == 3 && s[1].stat.count == 2 && s[2].stat.count == 1,
              "tier summary: counts 3,2,1");
  expect_true(near(s[0].stat.amount, 800.0) && near(s[1].stat.amount, 160.0) && near(s[2].stat.amount, 40.0),
              "tier summary: amounts 800,160,40");
  expect_true(near(s[0].stat.percent_count, 50.0) && near(s[2].stat.percent_count, 100.0 / 6.0),
              "tier summary: percent of count");
  expect_true(near(s[0].stat.percent_amount, 80.0) && near(s[1].stat.percent_amount, 16.0) &&
                  near(s[2].stat.percent_amount, 4.0),
              "tier summary: percent of amount");
}

void test_criticality_summary() {
  const auto s = summarize_by_criticality(sample_batch());

  expect_true(s[0].criticality == Criticality::Vital && s[1].criticality == Criticality::Essential &&
                  s[2].criticality == Criticality::NonEssential,
              "ven summary: order V,E,N");
  expect_true(s[0].stat.count == 3 && s[1].stat.count == 2 && s[2].stat.count == 1,
              "ven summary: counts 3,2,1");
  expect_true(near(s[0].stat.percent_amount, 80.0) && near(s[1].stat.percent_amount, 14.0) &&
                  near(s[2].stat.percent_amount, 6.0),
              "ven summary: percent of amount");
}

void test_summary_round_trip_on_classified_batch() {
  Items items;
  const double amounts[] = {1200.5, 33.0, 980.25, 4.75, 4.75, 61.0, 700.0, 0.0, 15.5, 250.0};
  for (int i = 0; i < 10; ++i) {
    Item it;
    it.code = i + 1;
    it.name = "Drug " + std::to_string(i + 1);
    it.amount = amounts[i];
    it.criticality = kCriticalities[static_cast<std::size_t>(i) % kCriticalityCount];
    items.push_back(it);
  }
  const auto classified = classify(items);
  const double total = total_amount(classified);

  std::size_t tier_count = 0, ven_count = 0;
  double tier_amount = 0.0, ven_amount = 0.0;
  for (const auto& r : summarize_by_tier(classified)) { tier_count += r.stat.count; tier_amount += r.stat.amount; }
  for (const auto& r : summarize_by_criticality(classified)) { ven_count += r.stat.count; ven_amount += r.stat.amount; }

  expect_true(tier_count == classified.size(), "round-trip: tier counts sum to item count");
  expect_true(ven_count == classified.size(), "round-trip: ven counts sum to item count");
  expect_true(near(tier_amount, total, 1e-6), "round-trip: tier amounts sum to total");
  expect_true(near(ven_amount, total, 1e-6), "round-trip: ven amounts sum to total");

  const auto m = build_matrix(classified);
  std::size_t cells = 0;
  double pct_amount = 0.0, pct_count = 0.0;
  for (const auto& row : m.cells) {
    for (const auto& c : row) { cells += c.count; pct_amount += c.percent_amount; pct_count += c.percent_count; }
  }
  expect_true(cells == classified.size(), "matrix: cell counts sum to item count");
  expect_true(near(pct_amount, 100.0, 1e-6), "matrix: percent_amount sums to 100");
  expect_true(near(pct_count, 100.0, 1e-6), "matrix: percent_count sums to 100");
}

void test_matrix_uses_grand_total() {
  const auto m = build_matrix(sample_batch());

  const auto& av = m.at(Tier::A, Criticality::Vital);
  expect_true(av.count == 2 && near(av.amount, 700.0), "matrix: A/V holds 2 items, 700");
  expect_true(near(av.percent_count, 100.0 * 2.0 / 6.0) && near(av.percent_amount, 70.0),
              "matrix: A/V percentages relative to grand total");

  const auto& bn = m.at(Tier::B, Criticality::NonEssential);
  expect_true(bn.count == 1 && near(bn.percent_amount, 6.0), "matrix: B/N is 6% of grand total");

  expect_true(is_zero_stat(m.at(Tier::C, Criticality::Vital)), "matrix: empty C/V cell zero-filled");
  expect_true(is_zero_stat(m.at(Tier::A, Criticality::NonEssential)), "matrix: empty A/N cell zero-filled");
}

void test_conditional_distribution_rows() {
  const auto d = build_conditional_distribution(sample_batch());

  expect_true(near(d.at(Tier::A, Criticality::Vital).percent_amount, 87.5) &&
                  near(d.at(Tier::A, Criticality::Essential).percent_amount, 12.5),
              "conditional: A row relative to A subtotal (700/800, 100/800)");
  expect_true(near(d.at(Tier::B, Criticality::Vital).percent_count, 50.0) &&
                  near(d.at(Tier::B, Criticality::NonEssential).percent_amount, 37.5),
              "conditional: B row relative to B subtotal");
  expect_true(near(d.at(Tier::C, Criticality::Essential).percent_amount, 100.0) &&
                  near(d.at(Tier::C, Criticality::Essential).percent_count, 100.0),
              "conditional: single-item C row is 100%");

  for (Tier t : kTiers) {
    double pc = 0.0, pa = 0.0;
    for (Criticality c : kCriticalities) {
      pc += d.at(t, c).percent_count;
      pa += d.at(t, c).percent_amount;
    }
    expect_true(near(pc, 100.0) && near(pa, 100.0),
                std::string("conditional: row ") + to_char(t) + " sums to 100");
  }
}

void test_empty_tier_zero_fill() {
  // No item in B.
  const ClassifiedItems batch{
      make_classified(1, 90.0, Tier::A, Criticality::Vital),
      make_classified(2, 10.0, Tier::C, Criticality::NonEssential),
  };

  const auto s = summarize_by_tier(batch);
  expect_true(s[1].tier == Tier::B && is_zero_stat(s[1].stat), "empty tier: B summary row is zero");

  const auto d = build_conditional_distribution(batch);
  bool b_zero = true;
  for (Criticality c : kCriticalities) {
    const auto& cell = d.at(Tier::B, c);
    if (!is_zero_stat(cell) || std::isnan(cell.percent_amount)) b_zero = false;
  }
  expect_true(b_zero, "empty tier: conditional B row is zero, not NaN");
}

void test_zero_amount_tier() {
  // Tier C has items but zero amount: amount percentages fall back to 0.
  const ClassifiedItems batch{
      make_classified(1, 100.0, Tier::A, Criticality::Vital),
      make_classified(2, 0.0, Tier::C, Criticality::Essential),
      make_classified(3, 0.0, Tier::C, Criticality::NonEssential),
  };
  const auto d = build_conditional_distribution(batch);
  expect_true(near(d.at(Tier::C, Criticality::Essential).percent_count, 50.0),
              "zero-amount tier: count percentages still computed");
  expect_true(d.at(Tier::C, Criticality::Essential).percent_amount == 0.0,
              "zero-amount tier: amount percentage is 0");
}

void test_negative_tier_subtotal() {
  // Tier A sums to -50; its amount shares collapse to 0 while count shares stay.
  const ClassifiedItems batch{
      make_classified(1, -100.0, Tier::A, Criticality::Vital),
      make_classified(2, 50.0, Tier::A, Criticality::NonEssential),
  };
  const auto d = build_conditional_distribution(batch);

  const auto& av = d.at(Tier::A, Criticality::Vital);
  const auto& an = d.at(Tier::A, Criticality::NonEssential);
  expect_true(av.percent_amount == 0.0 && an.percent_amount == 0.0,
              "conditional: negative subtotal gives 0% amount");
  expect_true(!std::signbit(av.percent_amount) && !std::signbit(an.percent_amount),
              "conditional: no negative zero");
  expect_true(near(av.percent_count, 50.0) && near(an.percent_count, 50.0),
              "conditional: count shares unaffected");
  expect_true(near(av.amount, -100.0) && near(an.amount, 50.0), "conditional: raw amounts kept");
}

void test_empty_batch() {
  const ClassifiedItems none;

  bool ok = true;
  for (const auto& r : summarize_by_tier(none)) ok = ok && is_zero_stat(r.stat);
  for (const auto& r : summarize_by_criticality(none)) ok = ok && is_zero_stat(r.stat);
  for (const auto& row : build_matrix(none).cells) for (const auto& c : row) ok = ok && is_zero_stat(c);
  for (const auto& row : build_conditional_distribution(none).cells) for (const auto& c : row) ok = ok && is_zero_stat(c);

  expect_true(ok, "empty batch: every structure zero-valued");
}

}  // namespace
}  // namespace abcven

int main() {
  using namespace abcven;

  test_percent_of_zero_denominator();
  test_tier_summary();
  test_criticality_summary();
  test_summary_round_trip_on_classified_batch();
  test_matrix_uses_grand_total();
  test_conditional_distribution_rows();
  test_empty_tier_zero_fill();
  test_zero_amount_tier();
  test_negative_tier_subtotal();
  test_empty_batch();

  if (g_fail_count != 0) {
    std::cerr << "\nabc_ven_aggregate_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nabc_ven_aggregate_selftest: all checks passed\n";
  return 0;
}
