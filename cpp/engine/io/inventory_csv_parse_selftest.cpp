/*
  Inventory CSV Record Source Selftest

  Objective
  ---------
  Framework-free checks of the export dialect:
    1) Header lines, blank lines and totals rows are skipped.
    2) Quoted names keep commas and doubled quotes.
    3) Decimal comma, lowercase / padded criticality, CRLF.
    4) Malformed rows are rejected with a reason, never thrown.
*/

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/core/errors.hpp"
#include "engine/io/inventory_csv_parse.hpp"

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

void expect_eq_str(const std::string& a, const std::string& b, std::string_view msg) {
  if (a != b) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
    std::cerr << "  a: " << a << "\n";
    std::cerr << "  b: " << b << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

std::string with_header(const std::vector<std::string>& rows, const char* eol = "\n") {
  std::string s =
      std::string("ОПН 2025 г.,,,,,") + eol +
      "По всем товарам.,,,,," + eol +
      "Товар - название,,Ед.,Операции расхода,," + eol +
      ",,,Кол-во,Сумма," + eol;
  for (std::size_t i = 0; i < rows.size(); ++i) {
    s += rows[i];
    if (i + 1 < rows.size()) s += eol;
  }
  return s;
}

void test_basic_row() {
  const auto items = parse_inventory_csv(with_header({
      "1,\"Адреналин амп. 0,1% 1мл №5\",уп.,5,384.4,V",
      "2,Азитромицин пор.,уп.,2,290,E",
  }));

  expect_true(items.size() == 2, "basic: two rows");
  expect_true(items[0].code == 1, "basic: code");
  expect_eq_str(items[0].name, "Адреналин амп. 0,1% 1мл №5", "basic: quoted name keeps comma");
  expect_eq_str(items[0].unit, "уп.", "basic: unit");
  expect_true(items[0].quantity == 5.0, "basic: quantity");
  expect_true(items[0].amount == 384.4, "basic: amount");
  expect_true(items[0].criticality == Criticality::Vital, "basic: V");
  expect_true(items[1].criticality == Criticality::Essential, "basic: E");
}

void test_skips_headers_blanks_and_totals() {
  RecordParseReport rep;
  const auto items = parse_inventory_csv(with_header({
      "1,Препарат А,уп.,10,1000,V",
      "",
      "   ",
      "2,Препарат Б,уп.,5,500,N",
      ",,Всего:,15,1500,",
      "",
  }), RecordSourceSettings(), &rep);

  expect_true(items.size() == 2, "skip: headers, blanks and totals row ignored");
  expect_true(rep.skipped.empty(), "skip: silent skips are not reported as rejects");
  expect_true(rep.items_accepted == 2, "skip: report counts accepted items");
  expect_true(rep.lines_scanned == 10, "skip: report counts scanned lines");

  const auto only_header = parse_inventory_csv(with_header({}));
  expect_true(only_header.empty(), "skip: header-only input gives no items");
}

void test_quotes_and_numbers() {
  const auto items = parse_inventory_csv(with_header({
      "1,\"Препарат, с запятой\",уп.,1,10,V",
      "2,\"Препарат \"\"в кавычках\"\"\",уп.,1,10,V",
      "3,Препарат,уп.,\"1,5\",\"1234,56\",E",
      "4,Препарат,уп.,0,0,N",
      "408,\"Синагис 100мг/мл 0,5мл №1\",уп.,927,28230955,V",
  }));

  expect_true(items.size() == 5, "quotes: all rows parsed");
  expect_eq_str(items[0].name, "Препарат, с запятой", "quotes: comma inside quotes");
  expect_eq_str(items[1].name, "Препарат \"в кавычках\"", "quotes: doubled quotes");
  expect_true(std::fabs(items[2].quantity - 1.5) < 1e-12, "numbers: decimal comma quantity");
  expect_true(std::fabs(items[2].amount - 1234.56) < 1e-9, "numbers: decimal comma amount");
  expect_true(items[3].quantity == 0.0 && items[3].amount == 0.0, "numbers: zero values");
  expect_true(items[4].code == 408 && items[4].quantity == 927.0 && items[4].amount == 28230955.0,
              "numbers: large amount");
}

void test_criticality_normalization() {
  const auto items = parse_inventory_csv(with_header({
      "1,A,уп.,1,1,v",
      "2,B,уп.,1,1, e ",
      "3,C,уп.,1,1,n\t",
  }));
  expect_true(items.size() == 3, "ven: lowercase and padded accepted");
  expect_true(items[0].criticality == Criticality::Vital &&
                  items[1].criticality == Criticality::Essential &&
                  items[2].criticality == Criticality::NonEssential,
              "ven: normalized to V,E,N");
}

void test_rejected_rows() {
  RecordParseReport rep;
  const auto items = parse_inventory_csv(with_header({
      "1,Good,уп.,1,10,V",
      "2,Bad ven,уп.,1,10,X",
      "abc,No code,уп.,1,10,E",
      "3,,уп.,1,10,E",
      "4,Short,уп.,1",
      "5,Huge,уп.,1,1e999,N",
      "6,Also good,фл.,2,20,E",
  }), RecordSourceSettings(), &rep);

  expect_true(items.size() == 2 && items[0].code == 1 && items[1].code == 6, "reject: only good rows kept");
  expect_true(rep.skipped.size() == 5, "reject: five rows reported");
  if (rep.skipped.size() == 5) {
    expect_true(rep.skipped[0].reason == SkipReason::kBadCriticality && rep.skipped[0].line == 6,
                "reject: bad criticality on line 6");
    expect_true(rep.skipped[1].reason == SkipReason::kBadCode, "reject: non-numeric code");
    expect_true(rep.skipped[2].reason == SkipReason::kEmptyName, "reject: empty name");
    expect_true(rep.skipped[3].reason == SkipReason::kTooFewColumns, "reject: too few columns");
    expect_true(rep.skipped[4].reason == SkipReason::kNonFiniteNumber, "reject: overflowing amount");
  }
  expect_eq_str(to_string(SkipReason::kEmptyName), "EmptyName", "reject: reason names");
}

void test_wide_codes() {
  RecordParseReport rep;
  const auto items = parse_inventory_csv(with_header({
      "4000000001,Wide code,уп.,1,10,V",
      "-12,Negative code,уп.,1,5,E",
      "99999999999999999999,Too wide,уп.,1,1,N",
  }), RecordSourceSettings(), &rep);

  expect_true(items.size() == 2, "codes: two rows kept");
  if (items.size() == 2) {
    expect_true(items[0].code == 4000000001LL, "codes: beyond 32-bit range accepted");
    expect_true(items[1].code == -12, "codes: signed");
  }
  expect_true(rep.skipped.size() == 1 && rep.skipped[0].reason == SkipReason::kBadCode &&
                  rep.skipped[0].line == 7,
              "codes: 64-bit overflow rejected");
}

void test_line_endings_and_stream() {
  const std::string crlf = with_header({"1,A,уп.,1,10,V", "2,B,уп.,1,20,E", ""}, "\r\n");
  const auto a = parse_inventory_csv(crlf);
  expect_true(a.size() == 2 && a[1].criticality == Criticality::Essential, "eol: CRLF accepted");

  std::istringstream in(with_header({"7,From stream,шт,3,12.5,N"}));
  const auto b = parse_inventory_csv(in);
  expect_true(b.size() == 1 && b[0].code == 7 && b[0].amount == 12.5, "stream: istream overload");
}

void test_helpers() {
  const auto f = split_csv_line("a,\"b,c\",,\"d\"\"e\"");
  expect_true(f.size() == 4, "split: four fields");
  if (f.size() == 4) {
    expect_eq_str(f[1], "b,c", "split: quoted delimiter");
    expect_eq_str(f[2], "", "split: empty field");
    expect_eq_str(f[3], "d\"e", "split: escaped quote");
  }

  expect_true(parse_decimal("12,5") == 12.5, "decimal: comma");
  expect_true(parse_decimal(" 7.25 ") == 7.25, "decimal: padded");
  expect_true(parse_decimal("3abc") == 3.0, "decimal: numeric prefix");
  expect_true(parse_decimal("abc") == 0.0, "decimal: no number -> 0");
  expect_true(parse_decimal("") == 0.0, "decimal: empty -> 0");
  expect_true(parse_decimal("-4") == -4.0, "decimal: sign");
}

void test_custom_settings() {
  RecordSourceSettings s;
  s.header_lines = 1;
  const auto items = parse_inventory_csv("code,name,unit,qty,amount,ven\n1,A,уп.,1,10,V\n", s);
  expect_true(items.size() == 1, "settings: single header line");

  bool threw = false;
  try {
    s.header_lines = -3;
    (void)parse_inventory_csv("", s);
  } catch (const ValidationError&) {
    threw = true;
  }
  expect_true(threw, "settings: invalid source settings rejected");
}

}  // namespace
}  // namespace abcven

int main() {
  using namespace abcven;

  test_basic_row();
  test_skips_headers_blanks_and_totals();
  test_quotes_and_numbers();
  test_criticality_normalization();
  test_rejected_rows();
  test_wide_codes();
  test_line_endings_and_stream();
  test_helpers();
  test_custom_settings();

  if (g_fail_count != 0) {
    std::cerr << "\ninventory_csv_parse_selftest: " << g_fail_count << " failure(s)\n";
    return 1;
  }
  std::cerr << "\ninventory_csv_parse_selftest: all checks passed\n";
  return 0;
}
