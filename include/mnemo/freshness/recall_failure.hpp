#pragma once

#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/recall_failure.hpp>
#include <mnemo/schema/recall_failure_reason.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mnemo::freshness {

struct recall_failure_context final {
  std::optional<std::string> query;
  std::optional<std::string> namespace_key;
  std::optional<std::string> session_id;
  std::optional<uint64_t> candidate_count;
  std::optional<uint64_t> filtered_count;
};

/// Canonical human-readable message for a reason code.
std::string_view recall_failure_message(
    mnemo::schema::recall_failure_reason_t reason);

/// Suggested remediations for a reason code.
std::vector<std::string> recall_failure_suggestions(
    mnemo::schema::recall_failure_reason_t reason);

/// Build a failure with id `rf_<ms>_<6 hex>`, not yet surfaced.
mnemo::schema::recall_failure_t make_recall_failure(
    mnemo::schema::recall_failure_reason_t reason,
    const recall_failure_context& context,
    mnemo::schema::timestamp_milliseconds_t now);

}  // namespace mnemo::freshness
