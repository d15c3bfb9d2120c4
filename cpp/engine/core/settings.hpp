#pragma once
/*
================================================================================
Core: Analysis Settings
FILE: cpp/engine/core/settings.hpp

Purpose:
  - Centralize every knob that changes classification, parsing or export output
    into a single validated object.
  - Defaults reproduce the standard ABC/VEN analysis (80% / 95% cutoffs) and the
    pharmacy consumption-report export dialect.

Hardening:
  - validate_or_throw() catches nonsensical values early.
  - No hidden global state: callers pass settings explicitly.
================================================================================
*/

#include <string>

#include "engine/core/errors.hpp"

namespace abcven {

// ----------------------------- Tier thresholds -------------------------------
// An item is tier A while the cumulative share of the items BEFORE it is below
// a_cutoff_pct, tier B while below b_cutoff_pct, tier C otherwise.
struct TierThresholds {
  double a_cutoff_pct = 80.0;
  double b_cutoff_pct = 95.0;

  void validate_or_throw() const {
    if (!(a_cutoff_pct > 0.0 && a_cutoff_pct < 100.0)) {
      throw ValidationError("TierThresholds: a_cutoff_pct must be in (0,100)");
    }
    if (!(b_cutoff_pct > a_cutoff_pct && b_cutoff_pct <= 100.0)) {
      throw ValidationError("TierThresholds: b_cutoff_pct must be in (a_cutoff_pct,100]");
    }
  }
};

// ----------------------------- Record source ---------------------------------
struct RecordSourceSettings {
  // Report header lines preceding the first data row.
  int header_lines = 4;

  // Totals rows look like ",,Всего:,10,1000," and are skipped.
  std::string total_row_marker = "Всего:";

  // Minimum number of fields for a data row (code,name,unit,qty,amount,ven).
  int min_columns = 6;

  void validate_or_throw() const {
    if (header_lines < 0 || header_lines > 1000) {
      throw ValidationError("RecordSourceSettings: header_lines outside sane bounds");
    }
    if (min_columns < 6 || min_columns > 256) {
      throw ValidationError("RecordSourceSettings: min_columns must be in [6,256]");
    }
  }
};

// ----------------------------- Export ----------------------------------------
struct ExportSettings {
  char delimiter = ';';

  // Decimal places for amounts and percentages.
  int precision = 2;

  bool include_header = true;

  void validate_or_throw() const {
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r' || delimiter == '\0') {
      throw ValidationError("ExportSettings: delimiter must be a printable non-quote character");
    }
    if (precision < 0 || precision > 12) {
      throw ValidationError("ExportSettings: precision must be in [0,12]");
    }
  }
};

// ----------------------------- AnalysisSettings ------------------------------
struct AnalysisSettings {
  TierThresholds thresholds;
  RecordSourceSettings source;
  ExportSettings exports;

  void validate_or_throw() const {
    thresholds.validate_or_throw();
    source.validate_or_throw();
    exports.validate_or_throw();
  }

  static AnalysisSettings defaults() {
    AnalysisSettings s;
    return s;
  }
};

}  // namespace abcven
