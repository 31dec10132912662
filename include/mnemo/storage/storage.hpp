#pragma once
#include <mnemo/schema/audit_entry.hpp>
#include <mnemo/schema/list_options.hpp>
#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/memory_query.hpp>
#include <mnemo/schema/memory_result.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/provenance_entry.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace mnemo::storage {

/// Persistence contract of the lifecycle manager. Memories live in one of
/// two partitions, primary or quarantine. A store persists what it is
/// given and never applies lifecycle rules itself.
template <typename Library>
struct store {
  /// Insert or overwrite a memory in the primary partition.
  void save_memory(const mnemo::schema::memory_object_t& memory);

  /// Primary partition lookup.
  std::optional<mnemo::schema::memory_object_t> get_memory(
      const mnemo::schema::memory_id_t& memory_id) const;

  /// Overwrite a memory in the primary partition.
  void update_memory(const mnemo::schema::memory_object_t& memory);

  /// Drop a memory from the primary partition. Used to move a memory into
  /// quarantine; it is not a lifecycle delete.
  void remove_memory(const mnemo::schema::memory_id_t& memory_id);

  /// Primary partition scan of one namespace, see list_memory_options.
  std::vector<mnemo::schema::memory_object_t> list_memories(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_memory_options_t& options,
      mnemo::schema::timestamp_milliseconds_t now) const;

  void save_quarantined(const mnemo::schema::memory_object_t& memory);

  std::optional<mnemo::schema::memory_object_t> get_quarantined(
      const mnemo::schema::memory_id_t& memory_id) const;

  std::vector<mnemo::schema::memory_object_t> list_quarantined(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_options_t& options) const;

  void delete_quarantined(const mnemo::schema::memory_id_t& memory_id);

  /// Filter active primary memories by the query and rank them, best first.
  /// The query limit is not applied.
  std::vector<mnemo::schema::memory_result_t> search_memories(
      const mnemo::schema::memory_query_t& query,
      mnemo::schema::timestamp_milliseconds_t now) const;

  /// Append an audit row. False when the row could not be written.
  bool log_audit(const mnemo::schema::audit_entry_t& entry);

  std::vector<mnemo::schema::audit_entry_t> get_audit_log(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_options_t& options) const;

  /// Provenance of a memory in either partition, empty when absent.
  std::vector<mnemo::schema::provenance_entry_t> get_memory_audit_log(
      const mnemo::schema::memory_id_t& memory_id) const;
};

/// Construct a concrete store. Persistent backends are rooted at `path`.
template <typename Library>
store<Library> make_store(const std::string_view& path);

}  // namespace mnemo::storage
