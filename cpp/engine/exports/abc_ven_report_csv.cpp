/*
================================================================================
Engine: CSV Report Exporter Implementation (ABC/VEN)
FILE: cpp/engine/exports/abc_ven_report_csv.cpp
================================================================================
*/

#include "engine/exports/abc_ven_report_csv.hpp"

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <sstream>

namespace abcven {

// Helper: always quote, escape quote as double-quote
static std::string csv_quote(const std::string& s) {
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out += c;
  }
  out += "\"";
  return out;
}

// Helper: format double, or empty string if NaN/Inf
static std::string csv_double(double x, int precision) {
  if (!std::isfinite(x)) return "";
  if (x == 0.0) x = 0.0;  // -0 prints as "0.00"
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(precision) << x;
  return oss.str();
}

static void write_stat_columns(std::ostream& os, const CategoryStat& s, const ExportSettings& opt) {
  const char d = opt.delimiter;
  os << s.count << d
     << csv_double(s.percent_count, opt.precision) << d
     << csv_double(s.amount, opt.precision) << d
     << csv_double(s.percent_amount, opt.precision);
}

template <typename Rows, typename LabelFn>
static bool write_summary_rows(std::ostream& os, const Rows& rows, LabelFn label,
                               const ExportSettings& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "category" << d << "count" << d << "percent_count" << d
       << "amount" << d << "percent_amount" << "\n";
  }

  CategoryStat total;
  for (const auto& row : rows) {
    os << label(row) << d;
    write_stat_columns(os, row.stat, opt);
    os << "\n";

    total.count += row.stat.count;
    total.amount += row.stat.amount;
    total.percent_count += row.stat.percent_count;
    total.percent_amount += row.stat.percent_amount;
  }

  os << "total" << d;
  write_stat_columns(os, total, opt);
  os << "\n";
  return os.good();
}

std::string get_items_csv_header(const ExportSettings& opt) {
  std::ostringstream h;
  const char d = opt.delimiter;
  h << "code" << d << "name" << d << "amount" << d
    << "percent_of_total" << d << "cumulative_percent" << d
    << "abc" << d << "ven";
  return h.str();
}

std::string classified_item_to_csv_row(const ClassifiedItem& ci, const ExportSettings& opt) {
  std::ostringstream row;
  const char d = opt.delimiter;
  row << ci.item.code << d
      << csv_quote(ci.item.name) << d
      << csv_double(ci.item.amount, opt.precision) << d
      << csv_double(ci.share_of_total_pct, opt.precision) << d
      << csv_double(ci.cumulative_share_pct, opt.precision) << d
      << to_char(ci.tier) << d
      << to_char(ci.item.criticality);
  return row.str();
}

bool write_classified_items_csv(std::ostream& os, const ClassifiedItems& items, const ExportSettings& opt) {
  if (opt.include_header) {
    os << get_items_csv_header(opt) << "\n";
  }
  for (const auto& ci : items) {
    os << classified_item_to_csv_row(ci, opt) << "\n";
  }
  return os.good();
}

bool write_tier_summary_csv(std::ostream& os, const TierSummary& summary, const ExportSettings& opt) {
  return write_summary_rows(os, summary,
                            [](const TierSummaryRow& r) { return to_char(r.tier); }, opt);
}

bool write_criticality_summary_csv(std::ostream& os, const CriticalitySummary& summary,
                                   const ExportSettings& opt) {
  return write_summary_rows(os, summary,
                            [](const CriticalitySummaryRow& r) { return to_char(r.criticality); }, opt);
}

bool write_grid_csv(std::ostream& os, const TierCriticalityGrid& grid, const ExportSettings& opt) {
  const char d = opt.delimiter;
  if (opt.include_header) {
    os << "abc" << d << "ven" << d << "count" << d << "percent_count" << d
       << "amount" << d << "percent_amount" << "\n";
  }
  for (Tier t : kTiers) {
    for (Criticality c : kCriticalities) {
      os << to_char(t) << d << to_char(c) << d;
      write_stat_columns(os, grid.at(t, c), opt);
      os << "\n";
    }
  }
  return os.good();
}

bool write_abc_ven_report_csv(std::ostream& os, const AbcVenReport& report, const ExportSettings& opt) {
  os << "# items\n";
  if (!write_classified_items_csv(os, report.items, opt)) return false;

  os << "\n# abc_summary\n";
  if (!write_tier_summary_csv(os, report.by_tier, opt)) return false;

  os << "\n# ven_summary\n";
  if (!write_criticality_summary_csv(os, report.by_criticality, opt)) return false;

  os << "\n# abc_ven_matrix\n";
  if (!write_grid_csv(os, report.matrix, opt)) return false;

  os << "\n# ven_within_abc\n";
  return write_grid_csv(os, report.conditional, opt);
}

}  // namespace abcven
