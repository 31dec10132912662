#pragma once

#include <mnemo/schema/ingestion_metadata.hpp>
#include <mnemo/schema/memory_source.hpp>
#include <mnemo/schema/memory_status.hpp>
#include <mnemo/schema/memory_version.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/provenance_entry.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: memory object.
// Versioned, provenance-tracked fact owned by one namespace. Only the
// lifecycle manager mutates it; stores persist what they are given.
namespace mnemo::schema {

template <uint16_t Version>
struct memory_object;

template <>
struct memory_object<1> final {
  memory_id_t memory_id;
  namespace_id_t ns;
  std::string content;
  std::string content_type{"text"};
  memory_source_t source;
  ingestion_metadata_t ingestion;
  /// Append-only; entries are never removed or reordered.
  std::vector<provenance_entry_t> provenance;
  tag_list_t tags;
  double importance{0.5};
  double task_criticality{0.5};
  std::optional<embedding_t> embedding;
  std::string created_at;
  std::optional<std::string> last_accessed_at;
  /// Absent: no TTL. Zero: expire on the next sweep.
  std::optional<uint64_t> ttl_seconds;
  std::optional<std::string> expires_at;
  std::vector<std::string> checkpoint_refs;
  /// Starts at 1 and grows by exactly one per edit or rollback.
  uint64_t version{1};
  /// Append-only; every snapshot version is below `version`.
  std::vector<memory_version_t> previous_versions;
  memory_status_t status{memory_status_t::active};
  std::optional<std::string> session_id;
  std::vector<std::string> accessed_in_sessions;
  uint64_t cross_session_recall_count{};
};

using memory_object_t = memory_object<1>;

}  // namespace mnemo::schema
