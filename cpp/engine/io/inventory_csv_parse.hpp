#pragma once
/*
================================================================================
IO: Inventory CSV Record Source
FILE: cpp/engine/io/inventory_csv_parse.hpp

Purpose:
  Parse a consumption-report export (comma separated, RFC-4180 style quoting)
  into abcven::Item records. Only well-formed rows reach the engine.

Dialect:
  - First `header_lines` lines are report headers (default 4).
  - Blank lines and totals rows (",,Всего:...") are skipped silently.
  - Columns: code, name, unit, quantity, amount, criticality (V/E/N).
  - Quoted fields may contain commas; "" inside quotes is a literal quote.
  - Quantity/amount accept a decimal comma ("384,4"); unparsable -> 0.
  - Criticality is trimmed and case-insensitive.
  - CRLF and LF line endings are both accepted.

Rejected rows (reported, never thrown):
  TooFewColumns, BadCode, EmptyName, BadCriticality, NonFiniteNumber.
================================================================================
*/

#include "engine/core/inventory.hpp"
#include "engine/core/settings.hpp"

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace abcven {

enum class SkipReason : int {
  kTooFewColumns = 0,
  kBadCode = 1,
  kEmptyName = 2,
  kBadCriticality = 3,
  kNonFiniteNumber = 4,
};

const char* to_string(SkipReason r) noexcept;

struct SkippedRow {
  int line = 0;  // 1-based line number in the input
  SkipReason reason = SkipReason::kTooFewColumns;
  std::string detail;
};

struct RecordParseReport {
  std::size_t lines_scanned = 0;
  std::size_t items_accepted = 0;
  std::vector<SkippedRow> skipped;
};

// Split one line into fields (quote-aware). Exposed for tests.
std::vector<std::string> split_csv_line(std::string_view line, char delim = ',');

// Parse a decimal that may use ',' as the decimal separator.
// Returns 0 for text with no numeric prefix.
double parse_decimal(std::string_view field);

// Parse from an in-memory buffer. `report` may be null.
Items parse_inventory_csv(std::string_view text,
                          const RecordSourceSettings& settings = RecordSourceSettings(),
                          RecordParseReport* report = nullptr);

// Parse from an open stream. Throws IOError if the stream fails mid-read.
Items parse_inventory_csv(std::istream& in,
                          const RecordSourceSettings& settings = RecordSourceSettings(),
                          RecordParseReport* report = nullptr);

}  // namespace abcven
