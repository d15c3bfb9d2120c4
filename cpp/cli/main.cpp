/*
================================================================================
CLI: Main Entry Point (abcven_cli)

Purpose:
  Run an ABC/VEN analysis over a consumption-report export:
    stdin (CSV export) -> record source -> classifier + aggregations -> stdout

Usage:
  abcven_cli < report.csv > analysis.csv

  The tool takes no arguments. Diagnostics go to stderr through the engine
  logger; set ABCVEN_LOG_LEVEL=debug|info|warn|error to change verbosity.

Output:
  Sections "# items", "# abc_summary", "# ven_summary", "# abc_ven_matrix",
  "# ven_within_abc", ';'-delimited, 2 decimals.

Exit Codes:
  0 - Success
  1 - Invalid arguments
  2 - No valid items in input
  3 - Processing failed
  4 - I/O error
================================================================================
*/

#include "engine/analysis/abc_ven_pipeline.hpp"
#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"
#include "engine/core/settings.hpp"
#include "engine/exports/abc_ven_report_csv.hpp"
#include "engine/io/inventory_csv_parse.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

using namespace abcven;

// Exit codes for CI integration
enum ExitCode {
  SUCCESS = 0,
  INVALID_ARGS = 1,
  NO_ITEMS = 2,
  PROCESSING_FAILED = 3,
  IO_ERROR = 4
};

static constexpr const char* kComponent = "cli";

static void print_usage(std::ostream& os) {
  os << "abcven_cli - ABC/VEN consumption analysis\n"
        "\n"
        "Usage:\n"
        "  abcven_cli < report.csv > analysis.csv\n"
        "\n"
        "Environment:\n"
        "  ABCVEN_LOG_LEVEL   debug | info | warn | error (default info)\n";
}

static void configure_logging() {
  set_log_stderr_only(true);

  const char* env = std::getenv("ABCVEN_LOG_LEVEL");
  if (!env || !*env) return;

  LogLevel lvl = LogLevel::INFO;
  if (parse_log_level(env, &lvl)) {
    set_log_level(lvl);
  } else {
    log(LogLevel::WARN, kComponent, std::string("ignoring unknown ABCVEN_LOG_LEVEL '") + env + "'");
  }
}

static void log_skipped_rows(const RecordParseReport& rep) {
  for (const auto& s : rep.skipped) {
    std::ostringstream oss;
    oss << "line " << s.line << " skipped: " << to_string(s.reason);
    if (!s.detail.empty()) oss << " (" << s.detail << ")";
    log(LogLevel::WARN, kComponent, oss.str());
  }
}

static void log_top_item(const AbcVenReport& report) {
  const auto top = report.top_item();
  if (!top) return;

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2)
      << "top item: " << top->item.name
      << " amount " << top->item.amount
      << " (" << top->share_of_total_pct << "%) "
      << to_char(top->tier) << "/" << to_char(top->item.criticality);
  log(LogLevel::INFO, kComponent, oss.str());
}

int main(int argc, char** /*argv*/) {
  if (argc > 1) {
    print_usage(std::cerr);
    return ExitCode::INVALID_ARGS;
  }

  configure_logging();

  try {
    const AnalysisSettings settings = AnalysisSettings::defaults();
    settings.validate_or_throw();

    RecordParseReport rep;
    const Items items = parse_inventory_csv(std::cin, settings.source, &rep);
    log_skipped_rows(rep);

    if (items.empty()) {
      log(LogLevel::ERROR, kComponent, "no valid items in input");
      return ExitCode::NO_ITEMS;
    }

    {
      std::ostringstream oss;
      oss << "loaded " << items.size() << " items";
      log(LogLevel::INFO, kComponent, oss.str());
    }

    const AbcVenReport report = run_abc_ven(items, settings);
    log_top_item(report);

    if (!write_abc_ven_report_csv(std::cout, report, settings.exports)) {
      log(LogLevel::ERROR, kComponent, "failed writing report to stdout");
      return ExitCode::IO_ERROR;
    }
    std::cout.flush();
    return std::cout.good() ? ExitCode::SUCCESS : ExitCode::IO_ERROR;

  } catch (const IOError& e) {
    log(LogLevel::ERROR, kComponent, e.what());
    return ExitCode::IO_ERROR;
  } catch (const ValidationError& e) {
    log(LogLevel::ERROR, kComponent, std::string("invalid settings: ") + e.what());
    return ExitCode::PROCESSING_FAILED;
  } catch (const std::exception& e) {
    log(LogLevel::ERROR, kComponent, e.what());
    return ExitCode::PROCESSING_FAILED;
  }
}
