#pragma once

#include <cstdint>

// Schema type: ranking weights.
// Coefficients of the composite relevance score.
namespace mnemo::schema {

template <uint16_t Version>
struct ranking_weights;

template <>
struct ranking_weights<1> final {
  double task_criticality{0.45};
  double semantic_similarity{0.25};
  double importance{0.20};
  double recency_decay{0.10};
};

using ranking_weights_t = ranking_weights<1>;

inline constexpr auto kDefaultRankingWeights = ranking_weights_t{};

}  // namespace mnemo::schema
