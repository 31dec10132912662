#include <mnemo/freshness/recall_failure.hpp>

#include <spdlog/fmt/fmt.h>

using namespace mnemo::schema;

namespace mnemo::freshness {

std::string_view recall_failure_message(const recall_failure_reason_t reason) {
  switch (reason) {
    case recall_failure_reason_t::no_matches:
      return "No memories matched the query";
    case recall_failure_reason_t::all_stale:
      return "All matching memories are stale (exceeded freshness SLO)";
    case recall_failure_reason_t::below_relevance_threshold:
      return "No memories met the relevance threshold";
    case recall_failure_reason_t::cross_session_unavailable:
      return "Cross-session memories could not be retrieved";
    case recall_failure_reason_t::storage_error:
      return "Storage backend returned an error";
    case recall_failure_reason_t::timeout:
      return "Memory retrieval timed out";
    case recall_failure_reason_t::embedding_unavailable:
      return "Vector embeddings are not available for semantic search";
    case recall_failure_reason_t::namespace_not_found:
      return "The specified namespace does not exist";
    case recall_failure_reason_t::quota_exceeded:
      return "Memory quota has been exceeded";
  }
  return "Unknown recall failure";
}

std::vector<std::string> recall_failure_suggestions(
    const recall_failure_reason_t reason) {
  switch (reason) {
    case recall_failure_reason_t::no_matches:
      return {"Try a broader query", "Check if memories exist in this namespace"};
    case recall_failure_reason_t::all_stale:
      return {"Refresh memories with updated content",
              "Increase freshness SLO max_age_hours"};
    case recall_failure_reason_t::below_relevance_threshold:
      return {"Lower the relevance threshold",
              "Add more specific tags to memories"};
    case recall_failure_reason_t::cross_session_unavailable:
      return {"Ensure cross-session tracking is enabled", "Check session history"};
    case recall_failure_reason_t::storage_error:
      return {"Check storage backend connectivity", "Review error logs"};
    case recall_failure_reason_t::timeout:
      return {"Reduce query scope", "Check system load"};
    case recall_failure_reason_t::embedding_unavailable:
      return {"Enable vector embeddings", "Use tag-based search instead"};
    case recall_failure_reason_t::namespace_not_found:
      return {"Verify namespace configuration", "Initialize the namespace"};
    case recall_failure_reason_t::quota_exceeded:
      return {"Delete old memories", "Upgrade storage quota"};
  }
  return {};
}

recall_failure_t make_recall_failure(const recall_failure_reason_t reason,
                                     const recall_failure_context& context,
                                     const timestamp_milliseconds_t now) {
  auto failure = recall_failure_t{};
  failure.failure_id = fmt::format("rf_{}_{}", now, make_uuid().substr(0, 6));
  failure.reason = reason;
  failure.message = std::string{recall_failure_message(reason)};
  failure.query = context.query;
  failure.namespace_key = context.namespace_key;
  failure.session_id = context.session_id;
  failure.timestamp = format_timestamp(now);
  failure.candidate_count = context.candidate_count;
  failure.filtered_count = context.filtered_count;
  failure.suggestions = recall_failure_suggestions(reason);
  failure.surfaced = false;
  return failure;
}

}  // namespace mnemo::freshness
