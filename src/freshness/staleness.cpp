#include <mnemo/freshness/staleness.hpp>

#include <algorithm>
#include <cmath>

#include <spdlog/fmt/fmt.h>

using namespace mnemo::schema;

namespace mnemo::freshness {

double staleness_score(const double age_hours, const freshness_slo_t& slo) {
  if (age_hours <= 0.0) {
    return 0.0;
  }
  if (age_hours >= slo.max_age_hours) {
    return 1.0;
  }
  auto grace = slo.max_age_hours * kGracePeriodFraction;
  if (age_hours <= grace) {
    return (age_hours / grace) * kGraceStaleness;
  }
  auto remaining = slo.max_age_hours - grace;
  auto overtime = age_hours - grace;
  return kGraceStaleness + (overtime / remaining) * (1.0 - kGraceStaleness);
}

staleness_metrics_t compute_staleness_metrics(
    const std::string_view created_at,
    const std::optional<std::string>& last_accessed_at,
    const timestamp_milliseconds_t now,
    const freshness_slo_t& slo) {
  auto metrics = staleness_metrics_t{};
  auto created = try_parse_timestamp(created_at);
  if (!created) {
    metrics.staleness_score = 1.0;
    metrics.is_stale = true;
    metrics.age_hours = slo.max_age_hours;
    metrics.age_days = slo.max_age_hours / 24.0;
    metrics.stale_reason = "Memory creation time is not a valid timestamp";
    metrics.time_until_stale_hours = 0.0;
    return metrics;
  }

  auto effective = *created;
  if (last_accessed_at) {
    if (auto accessed = try_parse_timestamp(*last_accessed_at)) {
      effective = std::max(effective, *accessed);
    }
  }

  metrics.age_hours = static_cast<double>(now - effective) /
                      static_cast<double>(kMillisecondsPerHour);
  metrics.age_days = metrics.age_hours / 24.0;
  metrics.staleness_score = staleness_score(metrics.age_hours, slo);
  metrics.is_stale = metrics.age_hours >= slo.max_age_hours;
  metrics.time_until_stale_hours = slo.max_age_hours - metrics.age_hours;
  if (metrics.is_stale) {
    metrics.stale_reason =
        fmt::format("Memory is {} days old (SLO: {} days)",
                    static_cast<int64_t>(std::floor(metrics.age_days)),
                    static_cast<int64_t>(std::floor(slo.max_age_hours / 24.0)));
  }
  return metrics;
}

void annotate(memory_result_t& result, const staleness_metrics_t& metrics) {
  result.staleness_score = metrics.staleness_score;
  result.is_stale = metrics.is_stale;
  result.age_days = metrics.age_days;
  result.age_hours = metrics.age_hours;
  result.stale_reason = metrics.stale_reason;
  result.time_until_stale_hours = metrics.time_until_stale_hours;
}

}  // namespace mnemo::freshness
