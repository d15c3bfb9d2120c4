#pragma once
/*
================================================================================
Core: Inventory Data Model (ABC/VEN)
FILE: cpp/engine/core/inventory.hpp

Purpose:
  Explicit value types shared by the classifier, the aggregations, the record
  source and the exporters:
    1) Item            - one priced consumption record (input, immutable)
    2) ClassifiedItem  - Item + share of total + cumulative share + tier
    3) CategoryStat    - count / amount / percent-of-count / percent-of-amount
    4) TierCriticalityGrid - dense 3x3 grid of CategoryStat

Rules:
  - Percentages are expressed in percent (0..100), not fractions.
  - Grids are dense: all 9 cells always exist.
  - This header defines *types only*. Computation lives in engine/analysis.
================================================================================
*/

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace abcven {

// VEN category.
enum class Criticality : int {
  Vital = 0,
  Essential = 1,
  NonEssential = 2,
};

// ABC category.
enum class Tier : int {
  A = 0,
  B = 1,
  C = 2,
};

inline constexpr std::size_t kTierCount = 3;
inline constexpr std::size_t kCriticalityCount = 3;

// Fixed reporting orders.
inline constexpr std::array<Tier, kTierCount> kTiers{Tier::A, Tier::B, Tier::C};
inline constexpr std::array<Criticality, kCriticalityCount> kCriticalities{
    Criticality::Vital, Criticality::Essential, Criticality::NonEssential};

inline constexpr std::size_t index_of(Tier t) noexcept { return static_cast<std::size_t>(t); }
inline constexpr std::size_t index_of(Criticality c) noexcept { return static_cast<std::size_t>(c); }

inline constexpr char to_char(Tier t) noexcept {
  switch (t) {
    case Tier::A: return 'A';
    case Tier::B: return 'B';
    case Tier::C: return 'C';
    default:      return '?';
  }
}

inline constexpr char to_char(Criticality c) noexcept {
  switch (c) {
    case Criticality::Vital:        return 'V';
    case Criticality::Essential:    return 'E';
    case Criticality::NonEssential: return 'N';
    default:                        return '?';
  }
}

// Case-insensitive V/E/N.
inline std::optional<Criticality> criticality_from_char(char c) noexcept {
  switch (c) {
    case 'V': case 'v': return Criticality::Vital;
    case 'E': case 'e': return Criticality::Essential;
    case 'N': case 'n': return Criticality::NonEssential;
    default:            return std::nullopt;
  }
}

struct Item {
  std::int64_t code = 0;
  std::string name;
  std::string unit;
  double quantity = 0.0;
  double amount = 0.0;
  Criticality criticality = Criticality::Vital;
};

struct ClassifiedItem {
  Item item;
  double share_of_total_pct = 0.0;
  double cumulative_share_pct = 0.0;
  Tier tier = Tier::A;
};

using Items = std::vector<Item>;
using ClassifiedItems = std::vector<ClassifiedItem>;

struct CategoryStat {
  std::size_t count = 0;
  double amount = 0.0;
  double percent_count = 0.0;
  double percent_amount = 0.0;
};

struct TierSummaryRow {
  Tier tier = Tier::A;
  CategoryStat stat;
};

struct CriticalitySummaryRow {
  Criticality criticality = Criticality::Vital;
  CategoryStat stat;
};

using TierSummary = std::array<TierSummaryRow, kTierCount>;
using CriticalitySummary = std::array<CriticalitySummaryRow, kCriticalityCount>;

// Rows = tier (A,B,C), columns = criticality (V,E,N).
struct TierCriticalityGrid {
  std::array<std::array<CategoryStat, kCriticalityCount>, kTierCount> cells{};

  CategoryStat& at(Tier t, Criticality c) noexcept { return cells[index_of(t)][index_of(c)]; }
  const CategoryStat& at(Tier t, Criticality c) const noexcept { return cells[index_of(t)][index_of(c)]; }
};

}  // namespace abcven
