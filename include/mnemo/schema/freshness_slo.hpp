#pragma once

#include <cstdint>

// Schema type: freshness SLO.
// Policy against which staleness and relevance compliance are measured.
namespace mnemo::schema {

template <uint16_t Version>
struct freshness_slo;

template <>
struct freshness_slo<1> final {
  /// 90 days.
  double max_age_hours{2160.0};
  double relevance_threshold{0.3};
  double recall_target_percent{95.0};
};

using freshness_slo_t = freshness_slo<1>;

template <uint16_t Version>
struct slo_config;

template <>
struct slo_config<1> final {
  freshness_slo_t freshness;
  bool enabled{true};
  double alert_threshold_percent{10.0};
  uint32_t evaluation_interval_minutes{60};
};

using slo_config_t = slo_config<1>;

/// Cross-session recall target, fixed by policy rather than configuration.
inline constexpr auto kCrossSessionTargetPercent = 90.0;
inline constexpr auto kCrossSessionCriticalPercent = 70.0;

}  // namespace mnemo::schema
