#pragma once

#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/ranking_weights.hpp>
#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: memory query.
// Ranked retrieval request scoped to one namespace.
namespace mnemo::schema {

template <uint16_t Version>
struct memory_query;

template <>
struct memory_query<1> final {
  namespace_id_t ns;
  std::optional<std::string> query;
  /// Cosine similarity is used against memories carrying an embedding of the
  /// same dimension; text similarity otherwise.
  std::optional<embedding_t> query_embedding;
  /// AND semantics.
  tag_list_t tags;
  std::vector<source_type_t> source_types;
  std::optional<double> min_importance;
  std::optional<double> min_semantic_similarity;
  /// Measured from the more recent of last_accessed_at and created_at.
  std::optional<uint64_t> max_age_seconds;
  std::optional<uint64_t> limit{10};
  bool include_content{true};
  std::optional<ranking_weights_t> ranking_weights;
  std::optional<std::string> session_id;
  bool include_cross_session{};
  std::optional<std::string> current_session_id;
  /// Caller deadline for the store round trip.
  std::optional<duration_milliseconds_t> timeout_ms;
};

using memory_query_t = memory_query<1>;

}  // namespace mnemo::schema
