#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: staleness metrics.
// Per-memory freshness breakdown under a given SLO.
namespace mnemo::schema {

template <uint16_t Version>
struct staleness_metrics;

template <>
struct staleness_metrics<1> final {
  double staleness_score{};
  bool is_stale{};
  double age_days{};
  double age_hours{};
  std::optional<std::string> stale_reason;
  /// Negative once stale.
  double time_until_stale_hours{};
};

using staleness_metrics_t = staleness_metrics<1>;

}  // namespace mnemo::schema
