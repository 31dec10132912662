#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: recall failure reason.
// Why a search produced no usable memories.
namespace mnemo::schema {

enum class recall_failure_reason_t : uint8_t {
  no_matches = 0,
  all_stale = 1,
  below_relevance_threshold = 2,
  cross_session_unavailable = 3,
  storage_error = 4,
  timeout = 5,
  embedding_unavailable = 6,
  namespace_not_found = 7,
  quota_exceeded = 8
};

inline constexpr auto kRecallFailureReasonMappings = std::array{
    std::pair<std::string_view, recall_failure_reason_t>{"no_matches", recall_failure_reason_t::no_matches},
    std::pair<std::string_view, recall_failure_reason_t>{"all_stale", recall_failure_reason_t::all_stale},
    std::pair<std::string_view, recall_failure_reason_t>{"below_relevance_threshold", recall_failure_reason_t::below_relevance_threshold},
    std::pair<std::string_view, recall_failure_reason_t>{"cross_session_unavailable", recall_failure_reason_t::cross_session_unavailable},
    std::pair<std::string_view, recall_failure_reason_t>{"storage_error", recall_failure_reason_t::storage_error},
    std::pair<std::string_view, recall_failure_reason_t>{"timeout", recall_failure_reason_t::timeout},
    std::pair<std::string_view, recall_failure_reason_t>{"embedding_unavailable", recall_failure_reason_t::embedding_unavailable},
    std::pair<std::string_view, recall_failure_reason_t>{"namespace_not_found", recall_failure_reason_t::namespace_not_found},
    std::pair<std::string_view, recall_failure_reason_t>{"quota_exceeded", recall_failure_reason_t::quota_exceeded}};

template <>
inline std::optional<recall_failure_reason_t> try_from_string<recall_failure_reason_t>(
    const std::string_view value) {
  return from_string(value, kRecallFailureReasonMappings);
}

inline constexpr std::string_view to_string(const recall_failure_reason_t value) {
  return to_string(value, kRecallFailureReasonMappings).value_or("unknown");
}

}  // namespace mnemo::schema
