#pragma once

#include <mnemo/schema/memory_source.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/provenance_entry.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: memory result.
// One ranked retrieval hit with its weighted score breakdown and freshness.
namespace mnemo::schema {

template <uint16_t Version>
struct score_components;

template <>
struct score_components<1> final {
  double task_criticality{};
  double semantic_similarity{};
  double importance{};
  double recency{};
};

using score_components_t = score_components<1>;

template <uint16_t Version>
struct memory_result;

template <>
struct memory_result<1> final {
  memory_id_t memory_id;
  double score{};
  /// Weighted contributions; they sum to `score`.
  score_components_t score_components;
  /// Unweighted similarity signal, used for relevance compliance.
  double semantic_similarity{};
  std::optional<double> staleness_score;
  std::optional<bool> is_stale;
  std::optional<double> age_days;
  std::optional<double> age_hours;
  std::optional<std::string> stale_reason;
  std::optional<double> time_until_stale_hours;
  std::optional<std::string> session_id;
  /// Timestamps the freshness annotation is computed from.
  std::string created_at;
  std::optional<std::string> last_accessed_at;
  std::optional<std::string> content;
  tag_list_t tags;
  memory_source_t source;
  std::vector<provenance_entry_t> provenance;
};

using memory_result_t = memory_result<1>;

}  // namespace mnemo::schema
