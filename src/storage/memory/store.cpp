#include <mnemo/ranking/ranking.hpp>
#include <mnemo/storage/filters.hpp>
#include <mnemo/storage/memory/store.hpp>

#include <spdlog/spdlog.h>

using namespace mnemo::schema;

namespace mnemo::storage {

template <>
store<memory_store_tag> make_store<memory_store_tag>(
    const std::string_view& path) {
  if (!path.empty()) {
    spdlog::debug("In-memory store ignores path {}", path);
  }
  return {};
}

void store<memory_store_tag>::save_memory(const memory_object_t& memory) {
  auto lock = std::scoped_lock{mutex_};
  primary_.insert_or_assign(memory.memory_id, memory);
}

std::optional<memory_object_t> store<memory_store_tag>::get_memory(
    const memory_id_t& memory_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = primary_.find(memory_id);
  if (it == std::end(primary_)) {
    return std::nullopt;
  }
  return it->second;
}

void store<memory_store_tag>::update_memory(const memory_object_t& memory) {
  auto lock = std::scoped_lock{mutex_};
  primary_.insert_or_assign(memory.memory_id, memory);
}

void store<memory_store_tag>::remove_memory(const memory_id_t& memory_id) {
  auto lock = std::scoped_lock{mutex_};
  primary_.erase(memory_id);
}

std::vector<memory_object_t> store<memory_store_tag>::list_memories(
    const namespace_id_t& ns,
    const list_memory_options_t& options,
    const timestamp_milliseconds_t now) const {
  auto memories = std::vector<memory_object_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& [id, memory] : primary_) {
      if (memory.ns == ns && matches_list_options(memory, options, now)) {
        memories.push_back(memory);
      }
    }
  }
  page(memories, options.order, options.offset, options.limit);
  return memories;
}

void store<memory_store_tag>::save_quarantined(const memory_object_t& memory) {
  auto lock = std::scoped_lock{mutex_};
  quarantine_.insert_or_assign(memory.memory_id, memory);
}

std::optional<memory_object_t> store<memory_store_tag>::get_quarantined(
    const memory_id_t& memory_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = quarantine_.find(memory_id);
  if (it == std::end(quarantine_)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<memory_object_t> store<memory_store_tag>::list_quarantined(
    const namespace_id_t& ns,
    const list_options_t& options) const {
  auto memories = std::vector<memory_object_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& [id, memory] : quarantine_) {
      if (memory.ns == ns) {
        memories.push_back(memory);
      }
    }
  }
  page(memories, options.order, options.offset, options.limit);
  return memories;
}

void store<memory_store_tag>::delete_quarantined(const memory_id_t& memory_id) {
  auto lock = std::scoped_lock{mutex_};
  quarantine_.erase(memory_id);
}

std::vector<memory_result_t> store<memory_store_tag>::search_memories(
    const memory_query_t& query,
    const timestamp_milliseconds_t now) const {
  auto candidates = std::vector<memory_object_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& [id, memory] : primary_) {
      if (matches_query(memory, query, now)) {
        candidates.push_back(memory);
      }
    }
  }
  return mnemo::ranking::rank_memories(candidates, query, now);
}

bool store<memory_store_tag>::log_audit(const audit_entry_t& entry) {
  auto lock = std::scoped_lock{mutex_};
  audit_.push_back(entry);
  return true;
}

std::vector<audit_entry_t> store<memory_store_tag>::get_audit_log(
    const namespace_id_t& ns,
    const list_options_t& options) const {
  auto entries = std::vector<audit_entry_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& entry : audit_) {
      if (entry.ns == ns) {
        entries.push_back(entry);
      }
    }
  }
  page(entries, options);
  return entries;
}

std::vector<provenance_entry_t> store<memory_store_tag>::get_memory_audit_log(
    const memory_id_t& memory_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (auto it = primary_.find(memory_id); it != std::end(primary_)) {
    return it->second.provenance;
  }
  if (auto it = quarantine_.find(memory_id); it != std::end(quarantine_)) {
    return it->second.provenance;
  }
  return {};
}

}  // namespace mnemo::storage
