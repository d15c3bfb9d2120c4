#pragma once
/*
================================================================================
Engine: CSV Report Exporter (ABC/VEN)
FILE: cpp/engine/exports/abc_ven_report_csv.hpp

Purpose:
  - Export the classified item list and the four ABC/VEN roll-ups as delimited
    text for spreadsheets and diffing.
  - Deterministic column and row ordering (A,B,C / V,E,N).

Hardening:
  - Item names are always quoted; embedded quotes are doubled.
  - NaN/Inf values export as empty string (not "nan").
  - Writers never throw on I/O; they return false if the stream failed.

Output format (default delimiter ';', 2 decimals):
  items:        code;name;amount;percent_of_total;cumulative_percent;abc;ven
  summaries:    category;count;percent_count;amount;percent_amount  (+ total row)
  grids:        abc;ven;count;percent_count;amount;percent_amount
================================================================================
*/

#include "engine/analysis/abc_ven_pipeline.hpp"
#include "engine/core/inventory.hpp"
#include "engine/core/settings.hpp"

#include <ostream>
#include <string>

namespace abcven {

// Header row for the classified item list (no newline).
std::string get_items_csv_header(const ExportSettings& opt = ExportSettings());

// One classified item as a CSV row (no newline).
std::string classified_item_to_csv_row(const ClassifiedItem& ci,
                                       const ExportSettings& opt = ExportSettings());

bool write_classified_items_csv(std::ostream& os,
                                const ClassifiedItems& items,
                                const ExportSettings& opt = ExportSettings());

bool write_tier_summary_csv(std::ostream& os,
                            const TierSummary& summary,
                            const ExportSettings& opt = ExportSettings());

bool write_criticality_summary_csv(std::ostream& os,
                                   const CriticalitySummary& summary,
                                   const ExportSettings& opt = ExportSettings());

// Matrix or conditional distribution; one row per (tier, criticality) cell.
bool write_grid_csv(std::ostream& os,
                    const TierCriticalityGrid& grid,
                    const ExportSettings& opt = ExportSettings());

// Every section of a report, each introduced by a "# <name>" line:
//   items, abc_summary, ven_summary, abc_ven_matrix, ven_within_abc
bool write_abc_ven_report_csv(std::ostream& os,
                              const AbcVenReport& report,
                              const ExportSettings& opt = ExportSettings());

}  // namespace abcven
