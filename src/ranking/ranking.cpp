#include <mnemo/ranking/ranking.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <string>
#include <unordered_set>

using namespace mnemo::schema;

namespace mnemo::ranking {

namespace {

std::unordered_set<std::string> word_set(const std::string_view text) {
  auto words = std::unordered_set<std::string>{};
  auto current = std::string{};
  for (const auto c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!current.empty()) {
        words.insert(std::move(current));
        current.clear();
      }
      continue;
    }
    current.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (!current.empty()) {
    words.insert(std::move(current));
  }
  return words;
}

double half_life_decay(const duration_milliseconds_t age,
                       const duration_milliseconds_t half_life) {
  return std::pow(0.5, static_cast<double>(age) / static_cast<double>(half_life));
}

}  // namespace

double clamp_unit(const double value) {
  if (std::isnan(value)) {
    return 0.0;
  }
  return std::clamp(value, 0.0, 1.0);
}

double recency_score(const std::string_view created_at,
                     const std::optional<std::string>& last_accessed_at,
                     const timestamp_milliseconds_t now) {
  auto created = try_parse_timestamp(created_at);
  if (!created) {
    return 0.0;
  }
  auto age_created = now - *created;
  if (age_created <= 0) {
    return 1.0;
  }
  auto created_score =
      half_life_decay(age_created, kCreatedHalfLifeMilliseconds);
  if (!last_accessed_at) {
    return clamp_unit(created_score);
  }
  auto accessed = try_parse_timestamp(*last_accessed_at);
  if (!accessed) {
    return clamp_unit(created_score);
  }
  auto age_accessed = now - *accessed;
  if (age_accessed < 0) {
    return clamp_unit(created_score);
  }
  auto access_score =
      half_life_decay(age_accessed, kAccessedHalfLifeMilliseconds);
  return clamp_unit(created_score + kAccessBoost * access_score);
}

score_t score_memory(const double task_criticality,
                     const double semantic_similarity,
                     const double importance,
                     const double recency,
                     const ranking_weights_t& weights) {
  auto result = score_t{};
  result.components.task_criticality =
      clamp_unit(task_criticality) * weights.task_criticality;
  result.components.semantic_similarity =
      clamp_unit(semantic_similarity) * weights.semantic_similarity;
  result.components.importance = clamp_unit(importance) * weights.importance;
  result.components.recency = clamp_unit(recency) * weights.recency_decay;
  result.score = result.components.task_criticality +
                 result.components.semantic_similarity +
                 result.components.importance + result.components.recency;
  return result;
}

double text_similarity(const std::string_view lhs, const std::string_view rhs) {
  auto lhs_words = word_set(lhs);
  auto rhs_words = word_set(rhs);
  if (lhs_words.empty() && rhs_words.empty()) {
    return 0.0;
  }
  auto intersection = std::size_t{};
  for (const auto& word : lhs_words) {
    if (rhs_words.contains(word)) {
      ++intersection;
    }
  }
  auto union_size = lhs_words.size() + rhs_words.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(union_size);
}

std::optional<double> cosine_similarity(const embedding_t& lhs,
                                        const embedding_t& rhs) {
  if (lhs.empty() || lhs.size() != rhs.size()) {
    return std::nullopt;
  }
  auto dot = 0.0;
  auto lhs_norm = 0.0;
  auto rhs_norm = 0.0;
  for (auto i = std::size_t{}; i < lhs.size(); ++i) {
    dot += lhs[i] * rhs[i];
    lhs_norm += lhs[i] * lhs[i];
    rhs_norm += rhs[i] * rhs[i];
  }
  if (lhs_norm == 0.0 || rhs_norm == 0.0) {
    return std::nullopt;
  }
  return clamp_unit(dot / (std::sqrt(lhs_norm) * std::sqrt(rhs_norm)));
}

double semantic_similarity(const memory_query_t& query,
                           const memory_object_t& memory) {
  if (query.query_embedding && memory.embedding) {
    auto cosine = cosine_similarity(*query.query_embedding, *memory.embedding);
    if (cosine) {
      return *cosine;
    }
  }
  if (!query.query || query.query->empty()) {
    return 0.0;
  }
  return text_similarity(*query.query, memory.content);
}

std::vector<memory_result_t> rank_memories(
    const std::vector<memory_object_t>& candidates,
    const memory_query_t& query,
    const timestamp_milliseconds_t now) {
  const auto& weights = query.ranking_weights.has_value()
                            ? query.ranking_weights.value()
                            : kDefaultRankingWeights;

  auto results = std::vector<memory_result_t>{};
  results.reserve(candidates.size());
  for (const auto& memory : candidates) {
    auto similarity = semantic_similarity(query, memory);
    auto recency =
        recency_score(memory.created_at, memory.last_accessed_at, now);
    auto scored = score_memory(memory.task_criticality, similarity,
                               memory.importance, recency, weights);

    auto result = memory_result_t{};
    result.memory_id = memory.memory_id;
    result.score = scored.score;
    result.score_components = scored.components;
    result.semantic_similarity = similarity;
    result.session_id = memory.session_id;
    result.created_at = memory.created_at;
    result.last_accessed_at = memory.last_accessed_at;
    if (query.include_content) {
      result.content = memory.content;
    }
    result.tags = memory.tags;
    result.source = memory.source;
    result.provenance = memory.provenance;
    results.push_back(std::move(result));
  }

  std::sort(std::begin(results), std::end(results),
            [](const auto& lhs, const auto& rhs) {
              if (lhs.score != rhs.score) {
                return lhs.score > rhs.score;
              }
              if (lhs.created_at != rhs.created_at) {
                return lhs.created_at > rhs.created_at;
              }
              return lhs.memory_id < rhs.memory_id;
            });
  return results;
}

}  // namespace mnemo::ranking
