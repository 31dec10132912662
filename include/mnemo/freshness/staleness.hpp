#pragma once

#include <mnemo/schema/freshness_slo.hpp>
#include <mnemo/schema/memory_result.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/staleness_metrics.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace mnemo::freshness {

/// Fraction of the grace period, relative to max_age_hours, during which
/// staleness only rises to kGraceStaleness.
inline constexpr auto kGracePeriodFraction = 0.5;
inline constexpr auto kGraceStaleness = 0.2;

/// Staleness in [0,1] for an effective age, monotonically non-decreasing.
double staleness_score(double age_hours,
                       const mnemo::schema::freshness_slo_t& slo =
                           mnemo::schema::freshness_slo_t{});

/// Effective age is measured from the more recent of created_at and
/// last_accessed_at. An unparseable created_at is treated as already stale.
mnemo::schema::staleness_metrics_t compute_staleness_metrics(
    std::string_view created_at,
    const std::optional<std::string>& last_accessed_at,
    mnemo::schema::timestamp_milliseconds_t now,
    const mnemo::schema::freshness_slo_t& slo =
        mnemo::schema::freshness_slo_t{});

/// Copy the staleness fields of `metrics` onto a ranked result.
void annotate(mnemo::schema::memory_result_t& result,
              const mnemo::schema::staleness_metrics_t& metrics);

}  // namespace mnemo::freshness
