#pragma once

#include <mnemo/schema/drift_metrics.hpp>
#include <mnemo/schema/drift_thresholds.hpp>
#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/primitives.hpp>
#include <vector>

namespace mnemo::drift {

/// Consecutive memories whose tag sets overlap less than this count as a
/// topic change.
inline constexpr auto kTopicChangeSimilarity = 0.3;

inline constexpr auto kTopicChangeWeight = 0.4;
inline constexpr auto kFragmentationWeight = 0.3;
inline constexpr auto kIncoherenceWeight = 0.3;

/// Jaccard similarity of two tag sets. Two empty sets are identical.
double tag_similarity(const mnemo::schema::tag_list_t& lhs,
                      const mnemo::schema::tag_list_t& rhs);

/// Topic coherence of a session's memories; input order is irrelevant, the
/// memories are ordered by created_at internally.
mnemo::schema::drift_metrics_t calculate_drift_metrics(
    const std::vector<mnemo::schema::memory_object_t>& memories,
    mnemo::schema::timestamp_milliseconds_t now,
    const mnemo::schema::drift_thresholds_t& thresholds =
        mnemo::schema::drift_thresholds_t{});

}  // namespace mnemo::drift
