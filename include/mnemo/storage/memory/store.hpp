#pragma once
#include <mnemo/storage/storage.hpp>
#include <map>
#include <mutex>
#include <string_view>
#include <vector>

namespace mnemo::storage {

struct memory_store_tag {};

/// In-process reference store. Every call copies in or out, so callers never
/// share state with the store.
template <>
struct store<memory_store_tag> {
  void save_memory(const mnemo::schema::memory_object_t& memory);
  std::optional<mnemo::schema::memory_object_t> get_memory(
      const mnemo::schema::memory_id_t& memory_id) const;
  void update_memory(const mnemo::schema::memory_object_t& memory);
  void remove_memory(const mnemo::schema::memory_id_t& memory_id);
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

  std::vector<mnemo::schema::memory_result_t> search_memories(
      const mnemo::schema::memory_query_t& query,
      mnemo::schema::timestamp_milliseconds_t now) const;

  bool log_audit(const mnemo::schema::audit_entry_t& entry);
  std::vector<mnemo::schema::audit_entry_t> get_audit_log(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_options_t& options) const;
  std::vector<mnemo::schema::provenance_entry_t> get_memory_audit_log(
      const mnemo::schema::memory_id_t& memory_id) const;

 private:
  mutable std::mutex mutex_;
  std::map<mnemo::schema::memory_id_t, mnemo::schema::memory_object_t>
      primary_;
  std::map<mnemo::schema::memory_id_t, mnemo::schema::memory_object_t>
      quarantine_;
  std::vector<mnemo::schema::audit_entry_t> audit_;
};

template <>
store<memory_store_tag> make_store<memory_store_tag>(
    const std::string_view& path);

}  // namespace mnemo::storage
