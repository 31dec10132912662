#pragma once

#include <mnemo/schema/recall_failure_reason.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: recall failure.
// Structured explanation returned instead of a silent empty result.
namespace mnemo::schema {

template <uint16_t Version>
struct recall_failure;

template <>
struct recall_failure<1> final {
  uint16_t version{1};
  std::string failure_id;
  recall_failure_reason_t reason{recall_failure_reason_t::no_matches};
  std::string message;
  std::optional<std::string> query;
  std::optional<std::string> namespace_key;
  std::optional<std::string> session_id;
  std::string timestamp;
  std::optional<uint64_t> candidate_count;
  std::optional<uint64_t> filtered_count;
  std::vector<std::string> suggestions;
  bool surfaced{};
};

using recall_failure_t = recall_failure<1>;

}  // namespace mnemo::schema
