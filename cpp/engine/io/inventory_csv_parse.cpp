/*
================================================================================
IO: Inventory CSV Record Source Implementation
FILE: cpp/engine/io/inventory_csv_parse.cpp
================================================================================
*/

#include "engine/io/inventory_csv_parse.hpp"

#include "engine/core/errors.hpp"
#include "engine/core/logging.hpp"

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <optional>
#include <sstream>
#include <utility>

namespace abcven {
namespace {

constexpr const char* kComponent = "record_source";

inline bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline bool is_digit(char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

// Leading integer, base 10, like a prefix parse: " 12abc" -> 12.
// Codes that overflow 64 bits are rejected.
bool parse_code(std::string_view field, std::int64_t* out) {
  const std::string buf(field);
  const char* b = buf.c_str();
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(b, &end, 10);
  if (end == b) return false;
  if (errno == ERANGE) return false;
  *out = static_cast<std::int64_t>(v);
  return true;
}

// Length of the longest [sign]digits[.digits][e[sign]digits] prefix of s.
std::size_t numeric_prefix_len(std::string_view s) {
  std::size_t i = 0;
  if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

  std::size_t digits = 0;
  while (i < s.size() && is_digit(s[i])) { ++i; ++digits; }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && is_digit(s[i])) { ++i; ++digits; }
  }
  if (digits == 0) return 0;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    std::size_t j = i + 1;
    if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
    const std::size_t exp_start = j;
    while (j < s.size() && is_digit(s[j])) ++j;
    if (j > exp_start) i = j;
  }
  return i;
}

void skip(RecordParseReport* report, int line, SkipReason reason, std::string detail) {
  if (!report) return;
  report->skipped.push_back(SkippedRow{line, reason, std::move(detail)});
}

}  // namespace

const char* to_string(SkipReason r) noexcept {
  switch (r) {
    case SkipReason::kTooFewColumns:   return "TooFewColumns";
    case SkipReason::kBadCode:         return "BadCode";
    case SkipReason::kEmptyName:       return "EmptyName";
    case SkipReason::kBadCriticality:  return "BadCriticality";
    case SkipReason::kNonFiniteNumber: return "NonFiniteNumber";
    default:                           return "Unknown";
  }
}

std::vector<std::string> split_csv_line(std::string_view line, char delim) {
  std::vector<std::string> out;
  std::string cur;
  bool in_quotes = false;

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
        cur += '"';
        ++i;
      } else {
        in_quotes = !in_quotes;
      }
    } else if (c == delim && !in_quotes) {
      out.push_back(std::move(cur));
      cur.clear();
    } else {
      cur += c;
    }
  }

  out.push_back(std::move(cur));
  return out;
}

double parse_decimal(std::string_view field) {
  std::string buf(trim(field));
  const auto comma = buf.find(',');
  if (comma != std::string::npos) buf[comma] = '.';

  const std::size_t n = numeric_prefix_len(buf);
  if (n == 0) return 0.0;
  buf.resize(n);
  return std::strtod(buf.c_str(), nullptr);
}

Items parse_inventory_csv(std::string_view text,
                          const RecordSourceSettings& settings,
                          RecordParseReport* report) {
  settings.validate_or_throw();

  Items items;
  const std::string total_prefix = ",," + settings.total_row_marker;
  const std::size_t min_cols = static_cast<std::size_t>(settings.min_columns);

  std::size_t pos = 0;
  int line_no = 0;
  std::size_t scanned = 0;

  while (pos <= text.size()) {
    const std::size_t nl = text.find('\n', pos);
    const std::size_t end = (nl == std::string_view::npos) ? text.size() : nl;
    std::string_view raw = text.substr(pos, end - pos);
    pos = end + 1;
    ++line_no;
    ++scanned;

    if (line_no <= settings.header_lines) {
      if (nl == std::string_view::npos) break;
      continue;
    }

    const std::string_view line = trim(raw);
    if (line.empty() || line.substr(0, total_prefix.size()) == total_prefix) {
      if (nl == std::string_view::npos) break;
      continue;
    }

    const auto f = split_csv_line(line, ',');
    if (f.size() < min_cols) {
      skip(report, line_no, SkipReason::kTooFewColumns,
           std::to_string(f.size()) + " fields");
    } else {
      Item it;
      const std::string ven(trim(f[5]));
      std::optional<Criticality> crit;
      if (ven.size() == 1) crit = criticality_from_char(ven[0]);

      if (!parse_code(f[0], &it.code)) {
        skip(report, line_no, SkipReason::kBadCode, f[0]);
      } else if (f[1].empty()) {
        skip(report, line_no, SkipReason::kEmptyName, "code " + std::to_string(it.code));
      } else if (!crit) {
        skip(report, line_no, SkipReason::kBadCriticality, "'" + ven + "'");
      } else {
        it.name = f[1];
        it.unit = f[2];
        it.quantity = parse_decimal(f[3]);
        it.amount = parse_decimal(f[4]);
        it.criticality = *crit;

        if (!std::isfinite(it.quantity) || !std::isfinite(it.amount)) {
          skip(report, line_no, SkipReason::kNonFiniteNumber, "code " + std::to_string(it.code));
        } else {
          items.push_back(std::move(it));
        }
      }
    }

    if (nl == std::string_view::npos) break;
  }

  if (report) {
    report->lines_scanned = scanned;
    report->items_accepted = items.size();
  }

  std::ostringstream oss;
  oss << "parsed " << items.size() << " items from " << scanned << " lines";
  if (report && !report->skipped.empty()) oss << " (" << report->skipped.size() << " rows rejected)";
  log(LogLevel::DEBUG, kComponent, oss.str());

  return items;
}

Items parse_inventory_csv(std::istream& in,
                          const RecordSourceSettings& settings,
                          RecordParseReport* report) {
  std::string text{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  if (in.bad()) {
    throw IOError("parse_inventory_csv: stream read failed");
  }
  return parse_inventory_csv(std::string_view(text), settings, report);
}

}  // namespace abcven
