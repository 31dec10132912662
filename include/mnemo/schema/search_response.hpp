#pragma once

#include <mnemo/schema/memory_result.hpp>
#include <mnemo/schema/recall_failure.hpp>
#include <cstdint>
#include <vector>

// Schema type: search response.
// Ranked results plus the diagnostics explaining anything filtered out.
namespace mnemo::schema {

template <uint16_t Version>
struct search_response;

template <>
struct search_response<1> final {
  uint16_t version{1};
  std::vector<memory_result_t> results;
  std::vector<recall_failure_t> failures;
  uint64_t total_candidates{};
  uint64_t stale_filtered{};
  uint64_t relevance_filtered{};
  bool cross_session_attempted{};
  bool cross_session_success{};
  int64_t query_time_ms{};
};

using search_response_t = search_response<1>;

}  // namespace mnemo::schema
