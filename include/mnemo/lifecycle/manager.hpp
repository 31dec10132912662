#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <mnemo/config/options.hpp>
#include <mnemo/drift/drift.hpp>
#include <mnemo/freshness/recall_failure.hpp>
#include <mnemo/freshness/slo.hpp>
#include <mnemo/freshness/staleness.hpp>
#include <mnemo/lifecycle/key_lock.hpp>
#include <mnemo/ranking/ranking.hpp>
#include <mnemo/schema/audit_entry.hpp>
#include <mnemo/schema/create_memory.hpp>
#include <mnemo/schema/drift_metrics.hpp>
#include <mnemo/schema/edit_memory.hpp>
#include <mnemo/schema/lifecycle_error_code.hpp>
#include <mnemo/schema/lifecycle_result.hpp>
#include <mnemo/schema/list_options.hpp>
#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/memory_query.hpp>
#include <mnemo/schema/merge_options.hpp>
#include <mnemo/schema/search_response.hpp>
#include <mnemo/schema/session_history_entry.hpp>
#include <mnemo/session/session.hpp>
#include <mnemo/storage/filters.hpp>
#include <mnemo/storage/storage.hpp>
#include <mnemo/validation/validator.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <iterator>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mnemo::lifecycle {

using clock_function_t = std::function<mnemo::schema::timestamp_milliseconds_t()>;
using audit_failure_handler_t =
    std::function<void(const mnemo::schema::audit_entry_t&)>;

inline constexpr auto kSystemActor = std::string_view{"system"};
inline constexpr auto kMergedIntoPrefix = std::string_view{"Merged into "};
inline constexpr auto kPromotedReason = std::string_view{"Promoted from quarantine"};

/// Milliseconds since the Unix epoch from the system clock.
inline mnemo::schema::timestamp_milliseconds_t system_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

struct drift_check_t final {
  bool alert{};
  mnemo::schema::drift_metrics_t metrics;
};

namespace detail {

inline std::string join(const std::vector<std::string>& values,
                        const std::string_view separator = ",") {
  auto joined = std::string{};
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined.append(separator);
    }
    joined.append(value);
  }
  return joined;
}

template <typename Result>
Result make_failure(const mnemo::schema::lifecycle_error_code code,
                    const std::string_view operation,
                    std::string log,
                    std::string info = {}) {
  auto result = Result{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = fmt::format("mnemo.lifecycle.{}", operation);
  return result;
}

inline mnemo::schema::lifecycle_result_t make_success(
    const std::string_view operation,
    mnemo::schema::memory_object_t memory,
    std::string info = {}) {
  auto result = mnemo::schema::lifecycle_result_t{};
  result.info = std::move(info);
  result.codespace = fmt::format("mnemo.lifecycle.{}", operation);
  result.memory = std::move(memory);
  return result;
}

inline mnemo::schema::memory_version_t make_snapshot(
    const mnemo::schema::memory_object_t& memory,
    std::string superseded_at,
    std::string superseded_by,
    std::optional<std::string> change_reason) {
  return mnemo::schema::memory_version_t{
      .version = memory.version,
      .content = memory.content,
      .content_type = memory.content_type,
      .tags = memory.tags,
      .importance = memory.importance,
      .task_criticality = memory.task_criticality,
      .superseded_at = std::move(superseded_at),
      .superseded_by = std::move(superseded_by),
      .change_reason = std::move(change_reason)};
}

/// `now` plus `days`, saturated at kMaxTimestamp. Non-positive or NaN
/// durations expire immediately.
inline mnemo::schema::timestamp_milliseconds_t expiry_after_days(
    const mnemo::schema::timestamp_milliseconds_t now,
    const double days) {
  using mnemo::schema::kMaxTimestamp;
  auto ttl = days * static_cast<double>(mnemo::schema::kMillisecondsPerDay);
  if (!(ttl > 0.0)) {
    return now;
  }
  if (now >= kMaxTimestamp || ttl >= static_cast<double>(kMaxTimestamp - now)) {
    return kMaxTimestamp;
  }
  return now + static_cast<mnemo::schema::timestamp_milliseconds_t>(ttl);
}

inline std::vector<std::string> sorted_unique(std::vector<std::string> values) {
  std::sort(std::begin(values), std::end(values));
  values.erase(std::unique(std::begin(values), std::end(values)),
               std::end(values));
  return values;
}

}  // namespace detail

/// Lifecycle state machine over a memory store.
///
/// Every mutation re-reads the memory under a per-id lock, appends exactly one
/// provenance entry and writes a best-effort audit row. Domain failures are
/// reported through the result envelope's `code`; store faults propagate.
template <typename Library>
class manager final {
 public:
  explicit manager(mnemo::storage::store<Library>& store,
                   mnemo::config::engine_options options = {},
                   mnemo::validation::validator_t validator = {},
                   clock_function_t clock = {})
      : store_(store),
        options_(std::move(options)),
        validator_(validator ? std::move(validator)
                             : mnemo::validation::make_default_validator(
                                   options_.validation)),
        clock_(clock ? std::move(clock) : clock_function_t{system_now}) {}

  manager(const manager&) = delete;
  manager& operator=(const manager&) = delete;

  const mnemo::config::engine_options& options() const { return options_; }

  /// Invoked with every audit row the store failed to write.
  void on_audit_failure(audit_failure_handler_t handler) {
    audit_failure_handler_ = std::move(handler);
  }

  /// Validate and store a new memory. Low-confidence input lands in the
  /// quarantine partition with status quarantined.
  mnemo::schema::lifecycle_result_t create_memory(
      const mnemo::schema::create_memory_t& input);

  /// Primary partition first, then quarantine.
  std::optional<mnemo::schema::memory_object_t> get_memory(
      const mnemo::schema::memory_id_t& memory_id) const;

  std::vector<mnemo::schema::memory_object_t> list_memories(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_memory_options_t& options = {}) const;

  std::vector<mnemo::schema::memory_object_t> list_quarantined(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_options_t& options = {}) const;

  /// Snapshot the current state, apply the supplied fields and bump version.
  mnemo::schema::lifecycle_result_t edit_memory(
      const mnemo::schema::memory_id_t& memory_id,
      const mnemo::schema::edit_memory_t& updates,
      const std::string& actor_id,
      const std::optional<std::string>& reason = std::nullopt);

  /// Soft delete; content and history are retained.
  mnemo::schema::lifecycle_result_t delete_memory(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& actor_id,
      const std::string& reason);

  /// Move an active memory into the quarantine partition.
  mnemo::schema::lifecycle_result_t quarantine_memory(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& actor_id,
      const std::string& reason);

  /// Move a quarantined memory back into the primary partition.
  mnemo::schema::lifecycle_result_t promote_quarantined(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& actor_id);

  /// Combine at least two memories of one namespace into a new memory and
  /// soft delete the sources. A retry after a partial merge resumes it.
  mnemo::schema::merge_result_t merge_memories(
      const std::vector<mnemo::schema::memory_id_t>& memory_ids,
      const std::string& merged_content,
      const std::string& actor_id,
      const mnemo::schema::merge_options_t& options = {});

  /// Restore the editable fields of `target_version`. The current state is
  /// snapshotted first and the version keeps increasing.
  mnemo::schema::lifecycle_result_t rollback_memory(
      const mnemo::schema::memory_id_t& memory_id,
      uint64_t target_version,
      const std::string& actor_id);

  /// Soft delete every active memory of the namespace whose TTL has run out,
  /// and with decay enabled every memory past the freshness SLO.
  mnemo::schema::expire_result_t expire_memories(
      const mnemo::schema::namespace_id_t& ns);

  mnemo::schema::lifecycle_result_t record_access(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& actor_id,
      const std::optional<std::string>& checkpoint_id = std::nullopt,
      const std::optional<std::string>& session_id = std::nullopt);

  mnemo::schema::lifecycle_result_t link_to_checkpoint(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& checkpoint_id,
      const std::string& actor_id);

  /// Mark for removal on the next expiry sweep.
  mnemo::schema::lifecycle_result_t invalidate_memory(
      const mnemo::schema::memory_id_t& memory_id,
      const std::string& actor_id,
      const std::string& reason);

  std::vector<mnemo::schema::provenance_entry_t> memory_audit_log(
      const mnemo::schema::memory_id_t& memory_id) const;

  /// Ranked, freshness-annotated retrieval. Never throws; empty results come
  /// with recall failures explaining them.
  mnemo::schema::search_response_t search_memories(
      const mnemo::schema::memory_query_t& query);

  std::vector<mnemo::schema::session_history_entry_t> session_history(
      const mnemo::schema::namespace_id_t& ns) const;

  std::vector<mnemo::schema::memory_object_t> session_memories(
      const mnemo::schema::namespace_id_t& ns,
      std::string_view session_id) const;

  mnemo::schema::drift_metrics_t drift_score(
      const mnemo::schema::namespace_id_t& ns,
      std::string_view session_id,
      const std::optional<mnemo::schema::drift_thresholds_t>& thresholds =
          std::nullopt) const;

  drift_check_t check_drift(
      const mnemo::schema::namespace_id_t& ns,
      std::string_view session_id,
      const std::optional<mnemo::schema::drift_thresholds_t>& thresholds =
          std::nullopt) const;

  mnemo::schema::slo_compliance_status_t evaluate_compliance(
      const mnemo::schema::namespace_id_t& ns,
      const std::vector<mnemo::schema::memory_result_t>& results,
      const std::vector<mnemo::schema::recall_failure_t>& failures,
      uint64_t cross_session_attempts,
      uint64_t cross_session_successes) const;

 private:
  enum class partition_t : uint8_t { primary, quarantine };

  struct located_t final {
    mnemo::schema::memory_object_t memory;
    partition_t partition{partition_t::primary};
  };

  std::optional<located_t> locate(
      const mnemo::schema::memory_id_t& memory_id) const;
  void persist(const located_t& located);

  mnemo::schema::memory_object_t build_memory(
      const mnemo::schema::create_memory_t& input,
      const mnemo::schema::validation_result_t& validation,
      mnemo::schema::timestamp_milliseconds_t now) const;

  void audit(const mnemo::schema::namespace_id_t& ns,
             mnemo::schema::audit_action_t action,
             std::string resource_id,
             std::string actor_id,
             mnemo::schema::attribute_list_t metadata);

  std::optional<mnemo::schema::memory_object_t> find_merge_in_progress(
      const std::vector<mnemo::schema::memory_object_t>& sources,
      const std::vector<mnemo::schema::memory_id_t>& source_ids) const;

  void record_cross_session_recall(const mnemo::schema::memory_id_t& memory_id,
                                   const std::string& session_id,
                                   const std::string& timestamp);

  bool namespace_is_empty(const mnemo::schema::namespace_id_t& ns) const;

  mnemo::storage::store<Library>& store_;
  mnemo::config::engine_options options_;
  mnemo::validation::validator_t validator_;
  clock_function_t clock_;
  audit_failure_handler_t audit_failure_handler_;
  key_lock locks_;
};

template <typename Library>
std::optional<typename manager<Library>::located_t> manager<Library>::locate(
    const mnemo::schema::memory_id_t& memory_id) const {
  if (auto memory = store_.get_memory(memory_id)) {
    return located_t{std::move(*memory), partition_t::primary};
  }
  if (auto memory = store_.get_quarantined(memory_id)) {
    return located_t{std::move(*memory), partition_t::quarantine};
  }
  return std::nullopt;
}

template <typename Library>
void manager<Library>::persist(const located_t& located) {
  if (located.partition == partition_t::primary) {
    store_.update_memory(located.memory);
  } else {
    store_.save_quarantined(located.memory);
  }
}

template <typename Library>
void manager<Library>::audit(const mnemo::schema::namespace_id_t& ns,
                             const mnemo::schema::audit_action_t action,
                             std::string resource_id,
                             std::string actor_id,
                             mnemo::schema::attribute_list_t metadata) {
  auto entry = mnemo::schema::audit_entry_t{};
  entry.id = mnemo::schema::make_uuid();
  entry.ns = ns;
  entry.action = action;
  entry.resource_id = std::move(resource_id);
  entry.actor_id = std::move(actor_id);
  entry.timestamp = mnemo::schema::format_timestamp(clock_());
  entry.metadata = std::move(metadata);

  auto written = false;
  try {
    written = store_.log_audit(entry);
  } catch (const std::exception& ex) {
    spdlog::warn("Audit write threw for {} {}: {}",
                 mnemo::schema::to_string(entry.action), entry.resource_id,
                 ex.what());
  }
  if (written) {
    return;
  }
  spdlog::warn("Audit entry {} for {} {} was not written", entry.id,
               mnemo::schema::to_string(entry.action), entry.resource_id);
  if (audit_failure_handler_) {
    audit_failure_handler_(entry);
  }
}

template <typename Library>
mnemo::schema::memory_object_t manager<Library>::build_memory(
    const mnemo::schema::create_memory_t& input,
    const mnemo::schema::validation_result_t& validation,
    const mnemo::schema::timestamp_milliseconds_t now) const {
  using namespace mnemo::schema;
  auto created_at = format_timestamp(now);
  auto reason = validation.quarantined
                    ? fmt::format("Created from {} and quarantined ({}% confidence)",
                                  to_string(input.source_type),
                                  std::lround(validation.confidence_score * 100))
                    : fmt::format("Created from {}", to_string(input.source_type));

  auto memory = memory_object_t{};
  memory.memory_id = make_uuid();
  memory.ns = input.ns;
  memory.content = validation.normalized_content;
  memory.content_type = validation.normalized_content_type;
  memory.source.type = input.source_type;
  memory.source.identifier = input.source_identifier;
  memory.source.timestamp = created_at;
  memory.source.metadata = input.source_metadata;
  memory.ingestion = ingestion_metadata_t{
      .source_type = validation.source_type,
      .source_id = validation.source_id,
      .ingestion_timestamp = created_at,
      .confidence_score = validation.confidence_score,
      .detected_format = validation.detected_format,
      .anomaly_flags = validation.anomaly_flags,
      .quarantined = validation.quarantined,
      .validation_notes = validation.validation_notes};
  memory.provenance.push_back(provenance_entry_t{
      .action = provenance_action_t::created,
      .actor_id = input.source_identifier,
      .timestamp = created_at,
      .reason = std::move(reason)});
  memory.tags = input.tags;
  memory.importance = input.importance.value_or(0.5);
  memory.task_criticality = input.task_criticality.value_or(0.5);
  memory.embedding = input.embedding;
  memory.created_at = created_at;
  memory.ttl_seconds = input.ttl_seconds;
  if (!input.ttl_seconds && options_.ttl.enabled &&
      options_.ttl.default_ttl_days) {
    memory.expires_at = format_timestamp(
        detail::expiry_after_days(now, *options_.ttl.default_ttl_days));
  }
  memory.status =
      validation.quarantined ? memory_status_t::quarantined : memory_status_t::active;
  memory.session_id = input.session_id;
  return memory;
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::create_memory(
    const mnemo::schema::create_memory_t& input) {
  using namespace mnemo::schema;
  auto validation = validator_(validation_input_t{
      .content = input.content,
      .source_type = input.source_type,
      .source_id = input.source_identifier,
      .declared_content_type = input.content_type});
  if (!validation.accepted) {
    auto reason = validation.rejection_reason.value_or(
        "Memory entry rejected by validation layer");
    spdlog::info("Rejected memory from {} in {}: {}",
                 to_string(input.source_type), make_namespace_key(input.ns),
                 reason);
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::validation_rejected, "create",
        "validation rejected", std::move(reason));
  }

  auto memory = build_memory(input, validation, clock_());
  if (validation.quarantined) {
    store_.save_quarantined(memory);
  } else {
    store_.save_memory(memory);
  }
  spdlog::debug("Created memory {} in {} ({})", memory.memory_id,
                make_namespace_key(memory.ns), to_string(memory.status));

  audit(memory.ns, audit_action_t::create, memory.memory_id,
        input.source_identifier,
        {{"quarantined", validation.quarantined ? "true" : "false"},
         {"confidence_score", fmt::format("{}", validation.confidence_score)},
         {"anomaly_flags", detail::join(validation.anomaly_flags)}});
  return detail::make_success("create", std::move(memory));
}

template <typename Library>
std::optional<mnemo::schema::memory_object_t> manager<Library>::get_memory(
    const mnemo::schema::memory_id_t& memory_id) const {
  if (auto located = locate(memory_id)) {
    return std::move(located->memory);
  }
  return std::nullopt;
}

template <typename Library>
std::vector<mnemo::schema::memory_object_t> manager<Library>::list_memories(
    const mnemo::schema::namespace_id_t& ns,
    const mnemo::schema::list_memory_options_t& options) const {
  return store_.list_memories(ns, options, clock_());
}

template <typename Library>
std::vector<mnemo::schema::memory_object_t> manager<Library>::list_quarantined(
    const mnemo::schema::namespace_id_t& ns,
    const mnemo::schema::list_options_t& options) const {
  return store_.list_quarantined(ns, options);
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::edit_memory(
    const mnemo::schema::memory_id_t& memory_id,
    const mnemo::schema::edit_memory_t& updates,
    const std::string& actor_id,
    const std::optional<std::string>& reason) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "edit", "memory not found", memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "edit",
        "cannot edit deleted memory", memory_id);
  }

  auto edited_at = format_timestamp(clock_());
  memory.previous_versions.push_back(
      detail::make_snapshot(memory, edited_at, actor_id, reason));

  auto previous_content = memory.content;
  if (updates.content) {
    memory.content = *updates.content;
  }
  if (updates.content_type) {
    memory.content_type = *updates.content_type;
  }
  if (updates.tags) {
    memory.tags = *updates.tags;
  }
  if (updates.importance) {
    memory.importance = *updates.importance;
  }
  if (updates.task_criticality) {
    memory.task_criticality = *updates.task_criticality;
  }
  if (updates.embedding) {
    memory.embedding = *updates.embedding;
  }
  ++memory.version;
  memory.provenance.push_back(provenance_entry_t{
      .action = provenance_action_t::edited,
      .actor_id = actor_id,
      .timestamp = edited_at,
      .reason = reason.value_or("Memory edited"),
      .version = memory.version,
      .previous_content = std::move(previous_content)});
  persist(*located);
  spdlog::debug("Edited memory {} to version {}", memory_id, memory.version);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"action_type", "edit"},
         {"new_version", std::to_string(memory.version)},
         {"reason", reason.value_or("")}});
  return detail::make_success("edit", std::move(memory));
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::delete_memory(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& actor_id,
    const std::string& reason) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "delete", "memory not found",
        memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::already_in_state, "delete",
        "memory already deleted", memory_id);
  }

  memory.status = memory_status_t::deleted;
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::deleted,
                         .actor_id = actor_id,
                         .timestamp = format_timestamp(clock_()),
                         .reason = reason});
  persist(*located);
  spdlog::info("Deleted memory {}: {}", memory_id, reason);

  audit(memory.ns, audit_action_t::remove, memory_id, actor_id,
        {{"reason", reason}, {"soft_delete", "true"}});
  return detail::make_success("delete", std::move(memory));
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::quarantine_memory(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& actor_id,
    const std::string& reason) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto primary = store_.get_memory(memory_id);
  auto quarantined = store_.get_quarantined(memory_id);
  if (!primary) {
    if (!quarantined) {
      return detail::make_failure<lifecycle_result_t>(
          lifecycle_error_code::not_found, "quarantine", "memory not found",
          memory_id);
    }
    if (quarantined->status == memory_status_t::deleted) {
      return detail::make_failure<lifecycle_result_t>(
          lifecycle_error_code::invalid_transition, "quarantine",
          "cannot quarantine deleted memory", memory_id);
    }
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::already_in_state, "quarantine",
        "memory already quarantined", memory_id);
  }

  if (primary->status == memory_status_t::quarantined) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::already_in_state, "quarantine",
        "memory already quarantined", memory_id);
  }
  if (primary->status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "quarantine",
        "cannot quarantine deleted memory", memory_id);
  }

  // Both copies present: a previous attempt stopped after the quarantine
  // write.
  if (quarantined && quarantined->status == memory_status_t::quarantined) {
    store_.remove_memory(memory_id);
    spdlog::info("Resumed quarantine of memory {}", memory_id);
    return detail::make_success("quarantine", std::move(*quarantined),
                                "resumed");
  }

  auto memory = std::move(*primary);
  memory.status = memory_status_t::quarantined;
  memory.ingestion.quarantined = true;
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::quarantined,
                         .actor_id = actor_id,
                         .timestamp = format_timestamp(clock_()),
                         .reason = reason});
  store_.save_quarantined(memory);
  store_.remove_memory(memory_id);
  spdlog::info("Quarantined memory {}: {}", memory_id, reason);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"action_type", "quarantine"}, {"reason", reason}});
  return detail::make_success("quarantine", std::move(memory));
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::promote_quarantined(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& actor_id) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto quarantined = store_.get_quarantined(memory_id);
  if (!quarantined) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "promote",
        "quarantined memory not found", memory_id);
  }
  if (quarantined->status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "promote",
        "cannot promote deleted memory", memory_id);
  }

  // Both copies present: a previous attempt stopped after the primary write.
  if (auto primary = store_.get_memory(memory_id);
      primary && primary->status == memory_status_t::active &&
      !primary->ingestion.quarantined) {
    store_.delete_quarantined(memory_id);
    spdlog::info("Resumed promotion of memory {}", memory_id);
    return detail::make_success("promote", std::move(*primary), "resumed");
  }

  auto memory = std::move(*quarantined);
  memory.status = memory_status_t::active;
  memory.ingestion.quarantined = false;
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::modified,
                         .actor_id = actor_id,
                         .timestamp = format_timestamp(clock_()),
                         .reason = std::string{kPromotedReason}});
  store_.save_memory(memory);
  store_.delete_quarantined(memory_id);
  spdlog::info("Promoted memory {} from quarantine", memory_id);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"promoted_from_quarantine", "true"},
         {"confidence_score",
          fmt::format("{}", memory.ingestion.confidence_score)}});
  return detail::make_success("promote", std::move(memory));
}

template <typename Library>
std::optional<mnemo::schema::memory_object_t>
manager<Library>::find_merge_in_progress(
    const std::vector<mnemo::schema::memory_object_t>& sources,
    const std::vector<mnemo::schema::memory_id_t>& source_ids) const {
  using namespace mnemo::schema;
  for (const auto& source : sources) {
    if (source.status != memory_status_t::deleted || source.provenance.empty()) {
      continue;
    }
    const auto& last = source.provenance.back();
    if (last.action != provenance_action_t::deleted || !last.reason ||
        !last.reason->starts_with(kMergedIntoPrefix)) {
      continue;
    }
    auto merged_id = last.reason->substr(kMergedIntoPrefix.size());
    auto merged = get_memory(merged_id);
    if (!merged) {
      continue;
    }
    for (const auto& entry : merged->provenance) {
      if (entry.action == provenance_action_t::merged &&
          detail::sorted_unique(entry.merged_from) == source_ids) {
        return merged;
      }
    }
  }
  return std::nullopt;
}

template <typename Library>
mnemo::schema::merge_result_t manager<Library>::merge_memories(
    const std::vector<mnemo::schema::memory_id_t>& memory_ids,
    const std::string& merged_content,
    const std::string& actor_id,
    const mnemo::schema::merge_options_t& options) {
  using namespace mnemo::schema;
  auto source_ids = detail::sorted_unique(memory_ids);
  if (source_ids.size() < 2) {
    return detail::make_failure<merge_result_t>(
        lifecycle_error_code::insufficient_sources, "merge",
        "at least 2 memories are required for merging");
  }
  auto locks = locks_.lock_all(source_ids);

  auto sources = std::vector<located_t>{};
  sources.reserve(memory_ids.size());
  for (const auto& id : memory_ids) {
    if (std::any_of(std::begin(sources), std::end(sources),
                    [&id](const auto& s) { return s.memory.memory_id == id; })) {
      continue;
    }
    auto located = locate(id);
    if (!located) {
      return detail::make_failure<merge_result_t>(
          lifecycle_error_code::not_found, "merge", "memory not found", id);
    }
    sources.push_back(std::move(*located));
  }

  auto memories = std::vector<memory_object_t>{};
  for (const auto& source : sources) {
    memories.push_back(source.memory);
  }
  auto merged_at = format_timestamp(clock_());

  auto resumed = find_merge_in_progress(memories, source_ids);
  if (!resumed) {
    for (const auto& memory : memories) {
      if (memory.status == memory_status_t::deleted) {
        return detail::make_failure<merge_result_t>(
            lifecycle_error_code::invalid_transition, "merge",
            "cannot merge deleted memory", memory.memory_id);
      }
    }
  }
  const auto& ns = memories.front().ns;
  for (const auto& memory : memories) {
    if (!(memory.ns == ns)) {
      return detail::make_failure<merge_result_t>(
          lifecycle_error_code::namespace_mismatch, "merge",
          "all memories must be in the same namespace to merge",
          memory.memory_id);
    }
  }

  auto merged = memory_object_t{};
  if (resumed) {
    merged = std::move(*resumed);
    spdlog::info("Resuming merge into memory {}", merged.memory_id);
  } else {
    auto tags = tag_list_t{};
    auto seen = std::set<std::string>{};
    auto importance = 0.0;
    auto task_criticality = 0.0;
    for (const auto& memory : memories) {
      for (const auto& tag : memory.tags) {
        if (seen.insert(tag).second) {
          tags.push_back(tag);
        }
      }
      importance += memory.importance;
      task_criticality += memory.task_criticality;
    }
    auto count = static_cast<double>(memories.size());

    auto input = create_memory_t{};
    input.ns = ns;
    input.content = merged_content;
    input.content_type = "text";
    input.source_type = source_type_t::system;
    input.source_identifier = actor_id;
    input.source_metadata = {{"merged_from", detail::join(memory_ids)},
                             {"merge_timestamp", merged_at}};
    input.tags = options.tags.value_or(std::move(tags));
    input.importance = options.importance.value_or(importance / count);
    input.task_criticality =
        options.task_criticality.value_or(task_criticality / count);

    auto validation = validator_(validation_input_t{
        .content = input.content,
        .source_type = input.source_type,
        .source_id = input.source_identifier,
        .declared_content_type = input.content_type});
    if (!validation.accepted) {
      return detail::make_failure<merge_result_t>(
          lifecycle_error_code::validation_rejected, "merge",
          "validation rejected",
          validation.rejection_reason.value_or(
              "Memory entry rejected by validation layer"));
    }

    merged = build_memory(input, validation, clock_());
    merged.provenance.push_back(provenance_entry_t{
        .action = provenance_action_t::merged,
        .actor_id = actor_id,
        .timestamp = merged_at,
        .reason = fmt::format("Merged from {} memories", memory_ids.size()),
        .merged_from = memory_ids});
    if (validation.quarantined) {
      store_.save_quarantined(merged);
    } else {
      store_.save_memory(merged);
    }
    audit(ns, audit_action_t::create, merged.memory_id, actor_id,
          {{"quarantined", validation.quarantined ? "true" : "false"},
           {"confidence_score", fmt::format("{}", validation.confidence_score)},
           {"anomaly_flags", detail::join(validation.anomaly_flags)}});
  }

  for (auto& source : sources) {
    if (source.memory.status == memory_status_t::deleted) {
      continue;
    }
    source.memory.status = memory_status_t::deleted;
    source.memory.provenance.push_back(provenance_entry_t{
        .action = provenance_action_t::deleted,
        .actor_id = actor_id,
        .timestamp = merged_at,
        .reason = fmt::format("{}{}", kMergedIntoPrefix, merged.memory_id)});
    persist(source);
  }
  spdlog::info("Merged {} memories into {}", memory_ids.size(),
               merged.memory_id);

  audit(ns, audit_action_t::update, merged.memory_id, actor_id,
        {{"action_type", "merge"}, {"merged_ids", detail::join(memory_ids)}});

  auto result = merge_result_t{};
  result.codespace = "mnemo.lifecycle.merge";
  result.info = resumed ? "resumed" : "";
  result.merged_memory = std::move(merged);
  result.merged_ids = memory_ids;
  return result;
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::rollback_memory(
    const mnemo::schema::memory_id_t& memory_id,
    const uint64_t target_version,
    const std::string& actor_id) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "rollback", "memory not found",
        memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "rollback",
        "cannot rollback deleted memory", memory_id);
  }
  if (memory.previous_versions.empty()) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::version_not_found, "rollback",
        "no previous versions to rollback to", memory_id);
  }
  auto target = std::find_if(
      std::begin(memory.previous_versions), std::end(memory.previous_versions),
      [target_version](const auto& v) { return v.version == target_version; });
  if (target == std::end(memory.previous_versions)) {
    auto available = std::vector<std::string>{};
    for (const auto& v : memory.previous_versions) {
      available.push_back(std::to_string(v.version));
    }
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::version_not_found, "rollback",
        fmt::format("version {} not found", target_version),
        fmt::format("available versions: {}", detail::join(available, ", ")));
  }
  // Copy before the push below invalidates the iterator.
  auto snapshot = *target;

  auto rolled_back_at = format_timestamp(clock_());
  auto reason = fmt::format("Rolled back to version {}", target_version);
  memory.previous_versions.push_back(
      detail::make_snapshot(memory, rolled_back_at, actor_id, reason));

  auto previous_content = memory.content;
  memory.content = snapshot.content;
  memory.content_type = snapshot.content_type;
  memory.tags = snapshot.tags;
  memory.importance = snapshot.importance;
  memory.task_criticality = snapshot.task_criticality;
  ++memory.version;
  memory.provenance.push_back(provenance_entry_t{
      .action = provenance_action_t::rolled_back,
      .actor_id = actor_id,
      .timestamp = rolled_back_at,
      .reason = std::move(reason),
      .version = memory.version,
      .previous_content = std::move(previous_content)});
  persist(*located);
  spdlog::info("Rolled back memory {} to version {} as version {}", memory_id,
               target_version, memory.version);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"action_type", "rollback"},
         {"target_version", std::to_string(target_version)},
         {"new_version", std::to_string(memory.version)}});
  return detail::make_success("rollback", std::move(memory));
}

template <typename Library>
mnemo::schema::expire_result_t manager<Library>::expire_memories(
    const mnemo::schema::namespace_id_t& ns) {
  using namespace mnemo::schema;
  auto now = clock_();
  auto now_text = format_timestamp(now);
  auto result = expire_result_t{};
  auto batch_size = std::max<uint64_t>(options_.expire_batch_size, 1);
  auto offset = uint64_t{};

  while (true) {
    auto page = store_.list_memories(
        ns,
        list_memory_options_t{.limit = batch_size,
                              .offset = offset,
                              .order = list_order_t::asc,
                              .status = memory_status_t::active,
                              .include_expired = true},
        now);
    auto expired_in_page = uint64_t{};
    for (const auto& listed : page) {
      auto lock = locks_.lock(listed.memory_id);
      auto memory = store_.get_memory(listed.memory_id);
      if (!memory || memory->status != memory_status_t::active) {
        continue;
      }
      auto reason = std::optional<std::string>{};
      if (mnemo::storage::is_expired(*memory, now)) {
        reason = "TTL expired";
      } else if (options_.ttl.decay_enabled &&
                 mnemo::freshness::compute_staleness_metrics(
                     memory->created_at, memory->last_accessed_at, now,
                     options_.slo.freshness)
                     .is_stale) {
        reason = "Freshness SLO exceeded";
      }
      if (!reason) {
        continue;
      }
      memory->status = memory_status_t::deleted;
      memory->provenance.push_back(
          provenance_entry_t{.action = provenance_action_t::expired,
                             .actor_id = std::string{kSystemActor},
                             .timestamp = now_text,
                             .reason = std::move(reason)});
      store_.update_memory(*memory);
      result.expired_ids.push_back(memory->memory_id);
      ++expired_in_page;
    }
    if (page.size() < batch_size) {
      break;
    }
    offset += page.size() - expired_in_page;
  }

  result.expired_count = result.expired_ids.size();
  if (result.expired_count > 0) {
    spdlog::info("Expired {} memories in {}", result.expired_count,
                 make_namespace_key(ns));
    audit(ns, audit_action_t::remove,
          fmt::format("batch:{}", result.expired_count),
          std::string{kSystemActor},
          {{"action_type", "expire"},
           {"expired_count", std::to_string(result.expired_count)},
           {"expired_ids", detail::join(result.expired_ids)}});
  }
  return result;
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::record_access(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& actor_id,
    const std::optional<std::string>& checkpoint_id,
    const std::optional<std::string>& session_id) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "access", "memory not found",
        memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "access",
        "cannot access deleted memory", memory_id);
  }

  auto accessed_at = format_timestamp(clock_());
  memory.last_accessed_at = accessed_at;
  if (checkpoint_id &&
      std::find(std::begin(memory.checkpoint_refs),
                std::end(memory.checkpoint_refs),
                *checkpoint_id) == std::end(memory.checkpoint_refs)) {
    memory.checkpoint_refs.push_back(*checkpoint_id);
  }
  if (session_id &&
      mnemo::session::is_new_cross_session_access(memory, *session_id)) {
    memory.accessed_in_sessions.push_back(*session_id);
    ++memory.cross_session_recall_count;
  }
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::accessed,
                         .actor_id = actor_id,
                         .checkpoint_id = checkpoint_id,
                         .timestamp = accessed_at});
  persist(*located);

  audit(memory.ns, audit_action_t::read, memory_id, actor_id,
        {{"checkpoint_id", checkpoint_id.value_or("")},
         {"session_id", session_id.value_or("")}});
  return detail::make_success("access", std::move(memory));
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::link_to_checkpoint(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& checkpoint_id,
    const std::string& actor_id) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "cite", "memory not found", memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "cite",
        "cannot cite deleted memory", memory_id);
  }
  memory.checkpoint_refs.push_back(checkpoint_id);
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::cited,
                         .actor_id = actor_id,
                         .checkpoint_id = checkpoint_id,
                         .timestamp = format_timestamp(clock_()),
                         .reason = "Referenced in checkpoint"});
  persist(*located);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"action_type", "cite"}, {"checkpoint_id", checkpoint_id}});
  return detail::make_success("cite", std::move(memory));
}

template <typename Library>
mnemo::schema::lifecycle_result_t manager<Library>::invalidate_memory(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& actor_id,
    const std::string& reason) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto located = locate(memory_id);
  if (!located) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::not_found, "invalidate", "memory not found",
        memory_id);
  }
  auto& memory = located->memory;
  if (memory.status == memory_status_t::deleted) {
    return detail::make_failure<lifecycle_result_t>(
        lifecycle_error_code::invalid_transition, "invalidate",
        "cannot invalidate deleted memory", memory_id);
  }
  memory.ttl_seconds = 0;
  memory.provenance.push_back(
      provenance_entry_t{.action = provenance_action_t::invalidated,
                         .actor_id = actor_id,
                         .timestamp = format_timestamp(clock_()),
                         .reason = reason});
  persist(*located);
  spdlog::info("Invalidated memory {}: {}", memory_id, reason);

  audit(memory.ns, audit_action_t::update, memory_id, actor_id,
        {{"action_type", "invalidate"}, {"reason", reason}});
  return detail::make_success("invalidate", std::move(memory));
}

template <typename Library>
std::vector<mnemo::schema::provenance_entry_t>
manager<Library>::memory_audit_log(
    const mnemo::schema::memory_id_t& memory_id) const {
  return store_.get_memory_audit_log(memory_id);
}

template <typename Library>
void manager<Library>::record_cross_session_recall(
    const mnemo::schema::memory_id_t& memory_id,
    const std::string& session_id,
    const std::string& timestamp) {
  using namespace mnemo::schema;
  auto lock = locks_.lock(memory_id);
  auto memory = store_.get_memory(memory_id);
  if (!memory || memory->status != memory_status_t::active ||
      !mnemo::session::is_new_cross_session_access(*memory, session_id)) {
    return;
  }
  memory->accessed_in_sessions.push_back(session_id);
  ++memory->cross_session_recall_count;
  memory->provenance.push_back(provenance_entry_t{
      .action = provenance_action_t::accessed,
      .actor_id = std::string{kSystemActor},
      .timestamp = timestamp,
      .reason = fmt::format("Recalled from session {}", session_id)});
  store_.update_memory(*memory);
}

template <typename Library>
bool manager<Library>::namespace_is_empty(
    const mnemo::schema::namespace_id_t& ns) const {
  auto options = mnemo::schema::list_memory_options_t{};
  options.limit = 1;
  options.include_expired = true;
  if (!store_.list_memories(ns, options, clock_()).empty()) {
    return false;
  }
  auto quarantine_options = mnemo::schema::list_options_t{};
  quarantine_options.limit = 1;
  return store_.list_quarantined(ns, quarantine_options).empty();
}

template <typename Library>
mnemo::schema::search_response_t manager<Library>::search_memories(
    const mnemo::schema::memory_query_t& query) {
  using namespace mnemo::schema;
  auto started = clock_();
  auto response = search_response_t{};
  auto effective = query;
  if (!effective.ranking_weights) {
    effective.ranking_weights = options_.ranking_weights;
  }
  auto current_session = query.current_session_id ? query.current_session_id
                                                   : query.session_id;
  auto context = mnemo::freshness::recall_failure_context{
      .query = query.query,
      .namespace_key = make_namespace_key(query.ns),
      .session_id = current_session};
  auto fail = [&](const recall_failure_reason_t reason) {
    context.candidate_count = response.total_candidates;
    context.filtered_count =
        response.stale_filtered + response.relevance_filtered;
    auto failure =
        mnemo::freshness::make_recall_failure(reason, context, clock_());
    failure.surfaced = true;
    spdlog::debug("Recall failure {} in {}: {}",
                  to_string(failure.reason), *context.namespace_key,
                  failure.message);
    response.failures.push_back(std::move(failure));
  };

  auto candidates = std::vector<memory_result_t>{};
  try {
    candidates = store_.search_memories(effective, started);
  } catch (const std::exception& ex) {
    spdlog::error("Memory search failed in {}: {}", *context.namespace_key,
                  ex.what());
    fail(recall_failure_reason_t::storage_error);
    response.query_time_ms = clock_() - started;
    return response;
  }
  response.total_candidates = candidates.size();

  auto elapsed = clock_() - started;
  if (query.timeout_ms && elapsed > *query.timeout_ms) {
    spdlog::warn("Memory search in {} exceeded {} ms", *context.namespace_key,
                 *query.timeout_ms);
    fail(recall_failure_reason_t::timeout);
    response.query_time_ms = elapsed;
    return response;
  }

  auto fresh = std::vector<memory_result_t>{};
  for (auto& candidate : candidates) {
    auto metrics = mnemo::freshness::compute_staleness_metrics(
        candidate.created_at, candidate.last_accessed_at, started,
        options_.slo.freshness);
    mnemo::freshness::annotate(candidate, metrics);
    if (query.max_age_seconds &&
        metrics.age_hours * 3600.0 > static_cast<double>(*query.max_age_seconds)) {
      ++response.stale_filtered;
      continue;
    }
    fresh.push_back(std::move(candidate));
  }

  auto relevance_dropped = std::vector<memory_id_t>{};
  for (auto& candidate : fresh) {
    if (query.min_semantic_similarity &&
        candidate.semantic_similarity < *query.min_semantic_similarity) {
      ++response.relevance_filtered;
      relevance_dropped.push_back(candidate.memory_id);
      continue;
    }
    response.results.push_back(std::move(candidate));
  }
  if (query.limit && response.results.size() > *query.limit) {
    response.results.resize(*query.limit);
  }

  if (query.include_cross_session && current_session) {
    response.cross_session_attempted = true;
    auto recalled_at = format_timestamp(started);
    for (const auto& result : response.results) {
      if (result.session_id == current_session) {
        continue;
      }
      response.cross_session_success = true;
      try {
        record_cross_session_recall(result.memory_id, *current_session,
                                    recalled_at);
      } catch (const std::exception& ex) {
        spdlog::warn("Failed to record cross-session recall of {}: {}",
                     result.memory_id, ex.what());
      }
    }
  }

  if (response.results.empty()) {
    try {
      if (response.total_candidates == 0) {
        fail(namespace_is_empty(query.ns)
                 ? recall_failure_reason_t::namespace_not_found
                 : recall_failure_reason_t::no_matches);
      } else if (response.stale_filtered == response.total_candidates) {
        fail(recall_failure_reason_t::all_stale);
      } else if (!relevance_dropped.empty()) {
        auto comparable = false;
        if (query.query_embedding) {
          for (const auto& id : relevance_dropped) {
            auto memory = store_.get_memory(id);
            if (memory && memory->embedding &&
                memory->embedding->size() == query.query_embedding->size()) {
              comparable = true;
              break;
            }
          }
        }
        fail(query.query_embedding && !comparable
                 ? recall_failure_reason_t::embedding_unavailable
                 : recall_failure_reason_t::below_relevance_threshold);
      } else {
        fail(recall_failure_reason_t::no_matches);
      }
    } catch (const std::exception& ex) {
      spdlog::error("Recall diagnosis failed in {}: {}", *context.namespace_key,
                    ex.what());
      fail(recall_failure_reason_t::storage_error);
    }
  }
  if (response.cross_session_attempted && !response.cross_session_success) {
    fail(recall_failure_reason_t::cross_session_unavailable);
  }

  auto tags = std::vector<std::string>{std::begin(query.tags),
                                       std::end(query.tags)};
  audit(query.ns, audit_action_t::search,
        fmt::format("query:{}", query.query.value_or("tags")),
        std::string{kSystemActor},
        {{"query", query.query.value_or("")},
         {"tags", detail::join(tags)},
         {"result_count", std::to_string(response.results.size())}});
  response.query_time_ms = clock_() - started;
  return response;
}

template <typename Library>
std::vector<mnemo::schema::session_history_entry_t>
manager<Library>::session_history(const mnemo::schema::namespace_id_t& ns) const {
  auto options = mnemo::schema::list_memory_options_t{};
  options.status = mnemo::schema::memory_status_t::active;
  return mnemo::session::group_by_session(
      ns, store_.list_memories(ns, options, clock_()));
}

template <typename Library>
std::vector<mnemo::schema::memory_object_t> manager<Library>::session_memories(
    const mnemo::schema::namespace_id_t& ns,
    const std::string_view session_id) const {
  auto options = mnemo::schema::list_memory_options_t{};
  options.status = mnemo::schema::memory_status_t::active;
  return mnemo::session::filter_by_session(
      store_.list_memories(ns, options, clock_()), session_id);
}

template <typename Library>
mnemo::schema::drift_metrics_t manager<Library>::drift_score(
    const mnemo::schema::namespace_id_t& ns,
    const std::string_view session_id,
    const std::optional<mnemo::schema::drift_thresholds_t>& thresholds) const {
  return mnemo::drift::calculate_drift_metrics(
      session_memories(ns, session_id), clock_(),
      thresholds.value_or(options_.drift));
}

template <typename Library>
drift_check_t manager<Library>::check_drift(
    const mnemo::schema::namespace_id_t& ns,
    const std::string_view session_id,
    const std::optional<mnemo::schema::drift_thresholds_t>& thresholds) const {
  auto metrics = drift_score(ns, session_id, thresholds);
  if (metrics.drift_detected) {
    spdlog::warn("Drift detected in session {} of {}: score {:.2f}",
                 session_id, mnemo::schema::make_namespace_key(ns),
                 metrics.drift_score);
  }
  return drift_check_t{.alert = metrics.drift_detected,
                       .metrics = std::move(metrics)};
}

template <typename Library>
mnemo::schema::slo_compliance_status_t manager<Library>::evaluate_compliance(
    const mnemo::schema::namespace_id_t& ns,
    const std::vector<mnemo::schema::memory_result_t>& results,
    const std::vector<mnemo::schema::recall_failure_t>& failures,
    const uint64_t cross_session_attempts,
    const uint64_t cross_session_successes) const {
  return mnemo::freshness::evaluate_namespace_compliance(
      ns, results, failures, cross_session_attempts, cross_session_successes,
      options_.slo, clock_());
}

}  // namespace mnemo::lifecycle
