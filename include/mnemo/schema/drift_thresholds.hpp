#pragma once

#include <cstdint>

// Schema type: drift thresholds.
namespace mnemo::schema {

template <uint16_t Version>
struct drift_thresholds;

template <>
struct drift_thresholds<1> final {
  double max_drift_score{0.4};
  double min_coherence_score{0.6};
  double max_fragmentation_score{0.3};
};

using drift_thresholds_t = drift_thresholds<1>;

}  // namespace mnemo::schema
