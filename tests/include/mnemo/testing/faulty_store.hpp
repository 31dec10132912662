#pragma once

#include <mnemo/storage/memory/store.hpp>

#include <optional>
#include <stdexcept>
#include <string>

namespace mnemo::storage {

struct faulty_store_tag {};

/// In-memory store with switchable faults. A fault armed with a countdown
/// fires on the call that brings it to zero, then disarms.
template <>
struct store<faulty_store_tag> : store<memory_store_tag> {
  using base_t = store<memory_store_tag>;

  bool fail_search{};
  bool fail_list{};
  bool fail_audit{};
  bool throw_on_audit{};
  std::optional<int> update_fault_countdown;
  std::optional<int> delete_quarantined_fault_countdown;
  std::optional<int> remove_memory_fault_countdown;

  std::vector<mnemo::schema::memory_result_t> search_memories(
      const mnemo::schema::memory_query_t& query,
      const mnemo::schema::timestamp_milliseconds_t now) const {
    if (fail_search) {
      throw std::runtime_error{"storage backend offline"};
    }
    return base_t::search_memories(query, now);
  }

  std::vector<mnemo::schema::memory_object_t> list_memories(
      const mnemo::schema::namespace_id_t& ns,
      const mnemo::schema::list_memory_options_t& options,
      const mnemo::schema::timestamp_milliseconds_t now) const {
    if (fail_list) {
      throw std::runtime_error{"storage backend offline"};
    }
    return base_t::list_memories(ns, options, now);
  }

  bool log_audit(const mnemo::schema::audit_entry_t& entry) {
    if (throw_on_audit) {
      throw std::runtime_error{"audit backend offline"};
    }
    if (fail_audit) {
      return false;
    }
    return base_t::log_audit(entry);
  }

  void update_memory(const mnemo::schema::memory_object_t& memory) {
    fire(update_fault_countdown, "update_memory");
    base_t::update_memory(memory);
  }

  void delete_quarantined(const mnemo::schema::memory_id_t& memory_id) {
    fire(delete_quarantined_fault_countdown, "delete_quarantined");
    base_t::delete_quarantined(memory_id);
  }

  void remove_memory(const mnemo::schema::memory_id_t& memory_id) {
    fire(remove_memory_fault_countdown, "remove_memory");
    base_t::remove_memory(memory_id);
  }

 private:
  static void fire(std::optional<int>& countdown, const std::string& call) {
    if (!countdown) {
      return;
    }
    if (--*countdown <= 0) {
      countdown.reset();
      throw std::runtime_error{"injected fault in " + call};
    }
  }
};

}  // namespace mnemo::storage
