#pragma once

#include <cstdint>
#include <string>

// Schema type: drift metrics.
// Topic coherence of one session's memories; all scores lie in [0,1].
namespace mnemo::schema {

template <uint16_t Version>
struct drift_metrics;

template <>
struct drift_metrics<1> final {
  double drift_score{};
  bool drift_detected{};
  uint64_t topic_changes{};
  double coherence_score{1.0};
  double fragmentation_score{};
  std::string last_checked_at;
};

using drift_metrics_t = drift_metrics<1>;

}  // namespace mnemo::schema
