#pragma once

#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/memory_query.hpp>
#include <mnemo/schema/memory_result.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/ranking_weights.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace mnemo::ranking {

inline constexpr auto kCreatedHalfLifeMilliseconds =
    7 * mnemo::schema::kMillisecondsPerDay;
inline constexpr auto kAccessedHalfLifeMilliseconds =
    (7 * mnemo::schema::kMillisecondsPerDay) / 2;
/// Upper bound on what a recent access can add on top of the age signal.
inline constexpr auto kAccessBoost = 0.2;

double clamp_unit(double value);

/// Recency in [0,1]. Age since creation decays with a 7 day half-life; a
/// recent access adds at most kAccessBoost with a 3.5 day half-life. Future
/// creation times score 1, future access times are ignored, and an
/// unparseable creation time scores 0.
double recency_score(std::string_view created_at,
                     const std::optional<std::string>& last_accessed_at,
                     mnemo::schema::timestamp_milliseconds_t now);

/// Weighted sum of the four signals. Inputs are clamped to [0,1] first.
struct score_t final {
  double score{};
  mnemo::schema::score_components_t components;
};

score_t score_memory(double task_criticality,
                     double semantic_similarity,
                     double importance,
                     double recency,
                     const mnemo::schema::ranking_weights_t& weights =
                         mnemo::schema::kDefaultRankingWeights);

/// Word-level Jaccard similarity of two texts, case-insensitive.
double text_similarity(std::string_view lhs, std::string_view rhs);

/// Cosine similarity clamped to [0,1]; nullopt for empty, mismatched or
/// zero-norm vectors.
std::optional<double> cosine_similarity(const mnemo::schema::embedding_t& lhs,
                                        const mnemo::schema::embedding_t& rhs);

/// Similarity signal for one memory: cosine when both sides carry
/// embeddings of equal dimension, text Jaccard otherwise, 0 without query
/// text.
double semantic_similarity(const mnemo::schema::memory_query_t& query,
                           const mnemo::schema::memory_object_t& memory);

/// Score and sort candidates by descending score. Ties keep the newer
/// memory first. No limit is applied.
std::vector<mnemo::schema::memory_result_t> rank_memories(
    const std::vector<mnemo::schema::memory_object_t>& candidates,
    const mnemo::schema::memory_query_t& query,
    mnemo::schema::timestamp_milliseconds_t now);

}  // namespace mnemo::ranking
