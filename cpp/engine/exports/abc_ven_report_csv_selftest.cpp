/*
  ABC/VEN CSV Exporter Selftest

  Objective
  ---------
    1) Item rows: quoted names, fixed decimals, tier/criticality letters.
    2) Summary sections end with a total row.
    3) Grids list all 9 cells in A,B,C x V,E,N order.
    4) NaN/Inf export as empty fields; failed streams report false.
*/

#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include "engine/analysis/abc_ven_pipeline.hpp"
#include "engine/core/logging.hpp"
#include "engine/exports/abc_ven_report_csv.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    fail(msg);
    std::cerr << "  got:\n" << a << "\n";
    std::cerr << "  expected:\n" << b << "\n";
  } else {
    pass(msg);
  }
}

bool contains(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

Item make_item(int code, const std::string& name, double amount, Criticality c) {
  Item it;
  it.code = code;
  it.name = name;
  it.unit = "уп.";
  it.quantity = 1.0;
  it.amount = amount;
  it.criticality = c;
  return it;
}

AbcVenReport sample_report() {
  return run_abc_ven(Items{
      make_item(4, "Delta", 5.0, Criticality::Vital),
      make_item(2, "Beta \"x\"", 15.0, Criticality::Essential),
      make_item(1, "Alpha", 70.0, Criticality::Vital),
      make_item(3, "Gamma; 10mg", 10.0, Criticality::NonEssential),
  });
}

void test_items_section() {
  const auto r = sample_report();
  std::ostringstream os;
  expect_true(write_classified_items_csv(os, r.items), "items: write succeeds");

  expect_eq_str(os.str(),
                "code;name;amount;percent_of_total;cumulative_percent;abc;ven\n"
                "1;\"Alpha\";70.00;70.00;70.00;A;V\n"
                "2;\"Beta \"\"x\"\"\";15.00;15.00;85.00;A;E\n"
                "3;\"Gamma; 10mg\";10.00;10.00;95.00;B;N\n"
                "4;\"Delta\";5.00;5.00;100.00;C;V\n",
                "items: rows in sorted order with quoted names");
}

void test_summary_sections() {
  const auto r = sample_report();

  std::ostringstream tiers;
  expect_true(write_tier_summary_csv(tiers, r.by_tier), "abc summary: write succeeds");
  expect_eq_str(tiers.str(),
                "category;count;percent_count;amount;percent_amount\n"
                "A;2;50.00;85.00;85.00\n"
                "B;1;25.00;10.00;10.00\n"
                "C;1;25.00;5.00;5.00\n"
                "total;4;100.00;100.00;100.00\n",
                "abc summary: rows A,B,C + total");

  std::ostringstream ven;
  expect_true(write_criticality_summary_csv(ven, r.by_criticality), "ven summary: write succeeds");
  expect_eq_str(ven.str(),
                "category;count;percent_count;amount;percent_amount\n"
                "V;2;50.00;75.00;75.00\n"
                "E;1;25.00;15.00;15.00\n"
                "N;1;25.00;10.00;10.00\n"
                "total;4;100.00;100.00;100.00\n",
                "ven summary: rows V,E,N + total");
}

void test_grid_sections() {
  const auto r = sample_report();

  std::ostringstream m;
  expect_true(write_grid_csv(m, r.matrix), "matrix: write succeeds");
  const std::string ms = m.str();
  expect_true(contains(ms, "abc;ven;count;percent_count;amount;percent_amount\n"), "matrix: header");
  expect_true(contains(ms, "A;V;1;25.00;70.00;70.00\n"), "matrix: A/V vs grand total");
  expect_true(contains(ms, "C;N;0;0.00;0.00;0.00\n"), "matrix: empty cell present");

  std::size_t lines = 0;
  for (char c : ms) lines += (c == '\n');
  expect_true(lines == 10, "matrix: header + 9 cells");

  std::ostringstream d;
  expect_true(write_grid_csv(d, r.conditional), "conditional: write succeeds");
  expect_true(contains(d.str(), "A;V;1;50.00;70.00;82.35\n"), "conditional: A/V vs tier A subtotal");
  expect_true(contains(d.str(), "A;E;1;50.00;15.00;17.65\n"), "conditional: A/E vs tier A subtotal");
  expect_true(contains(d.str(), "B;N;1;100.00;10.00;100.00\n"), "conditional: lone B item is 100%");
}

void test_full_report_and_options() {
  const auto r = sample_report();

  std::ostringstream all;
  expect_true(write_abc_ven_report_csv(all, r), "report: write succeeds");
  const std::string s = all.str();
  expect_true(contains(s, "# items\n") && contains(s, "\n# abc_summary\n") &&
                  contains(s, "\n# ven_summary\n") && contains(s, "\n# abc_ven_matrix\n") &&
                  contains(s, "\n# ven_within_abc\n"),
              "report: all five sections present");
  expect_true(s.find("# items") < s.find("# abc_summary") &&
                  s.find("# abc_summary") < s.find("# ven_within_abc"),
              "report: section order");

  ExportSettings opt;
  opt.delimiter = ',';
  opt.precision = 1;
  opt.include_header = false;
  expect_eq_str(classified_item_to_csv_row(r.items[2], opt), "3,\"Gamma; 10mg\",10.0,10.0,95.0,B,N",
                "options: delimiter and precision");

  std::ostringstream no_header;
  (void)write_classified_items_csv(no_header, r.items, opt);
  expect_true(no_header.str().rfind("1,\"Alpha\"", 0) == 0, "options: header suppressed");
}

void test_nonfinite_and_failed_stream() {
  ClassifiedItem ci;
  ci.item.code = 9;
  ci.item.name = "Odd";
  ci.item.amount = std::numeric_limits<double>::quiet_NaN();
  ci.share_of_total_pct = std::numeric_limits<double>::infinity();
  expect_eq_str(classified_item_to_csv_row(ci), "9;\"Odd\";;;0.00;A;V", "nonfinite: empty fields");

  ClassifiedItem neg;
  neg.item.code = 4000000001LL;
  neg.item.name = "Neg";
  neg.item.amount = -0.0;
  neg.share_of_total_pct = -0.0;
  expect_eq_str(classified_item_to_csv_row(neg), "4000000001;\"Neg\";0.00;0.00;0.00;A;V",
                "negative zero: printed without sign, wide code");

  std::ostringstream bad;
  bad.setstate(std::ios::badbit);
  expect_true(!write_abc_ven_report_csv(bad, sample_report()), "stream: failure reported as false");
}

}  // namespace
}  // namespace abcven

int main() {
  using namespace abcven;

  set_log_level(LogLevel::WARN);

  test_items_section();
  test_summary_sections();
  test_grid_sections();
  test_full_report_and_options();
  test_nonfinite_and_failed_stream();

  if (g_fail_count != 0) {
    std::cerr << "\nabc_ven_report_csv_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\nabc_ven_report_csv_selftest: all checks passed\n";
  return 0;
}
