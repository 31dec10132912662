#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <mnemo/common/critical.hpp>
#include <mnemo/ranking/ranking.hpp>
#include <mnemo/schema/encoding/scale/encoder.hpp>
#include <mnemo/storage/filters.hpp>
#include <mnemo/storage/storage.hpp>
#include <functional>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace mnemo::storage {

namespace detail {

using encoder_t = mnemo::schema::encoding::encoder<
    mnemo::schema::encoding::scale_encoder_tag>;

inline constexpr auto kPrimaryPrefix = std::string_view{"MEM|PRIMARY|"};
inline constexpr auto kQuarantinePrefix = std::string_view{"MEM|QUARANTINE|"};
inline constexpr auto kAuditPrefix = std::string_view{"MEM|AUDIT|"};

inline std::string make_key(const std::string_view prefix,
                            const std::string_view id) {
  auto key = std::string{prefix};
  key.append(id);
  return key;
}

/// `MEM|AUDIT|<namespace key>|` scopes one namespace; the timestamp keeps
/// rows in write order within it.
inline std::string make_audit_prefix(const mnemo::schema::namespace_id_t& ns) {
  auto key = std::string{kAuditPrefix};
  key.append(mnemo::schema::make_namespace_key(ns));
  key.push_back('|');
  return key;
}

inline std::string make_audit_key(const mnemo::schema::audit_entry_t& entry) {
  auto key = make_audit_prefix(entry.ns);
  key.append(entry.timestamp);
  key.push_back('|');
  key.append(entry.id);
  return key;
}

inline mnemo::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

}  // namespace detail

struct rocksdb_store_tag {};

template <>
struct store<rocksdb_store_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

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
  template <typename T>
  std::optional<T> get(const std::string& key) const;

  template <typename T>
  void put(const std::string& key, const T& value);

  void erase(const std::string& key);

  /// Visit every decodable record under prefix in key order.
  template <typename T>
  void scan(const std::string_view prefix,
            const std::function<void(T&&)>& visit) const;
};

template <>
store<rocksdb_store_tag> make_store<rocksdb_store_tag>(
    const std::string_view& path);

template <typename T>
std::optional<T> store<rocksdb_store_tag>::get(const std::string& key) const {
  if (!database) {
    mnemo::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    mnemo::common::critical("Failed to get value from RocksDB");
  }
  auto encoder = detail::encoder_t{};
  return {encoder.decode<T>(mnemo::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T>
void store<rocksdb_store_tag>::put(const std::string& key, const T& value) {
  if (!database) {
    mnemo::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(value);
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(encoded.data()), encoded.size()};
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, key, value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    mnemo::common::critical("Failed to put value into RocksDB");
  }
}

inline void store<rocksdb_store_tag>::erase(const std::string& key) {
  if (!database) {
    mnemo::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, key);
  if (!status.ok()) {
    spdlog::error("Failed to delete key from RocksDB: {}", status.ToString());
    mnemo::common::critical("Failed to delete key from RocksDB");
  }
}

template <typename T>
void store<rocksdb_store_tag>::scan(
    const std::string_view prefix,
    const std::function<void(T&&)>& visit) const {
  if (!database) {
    mnemo::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(ROCKSDB_NAMESPACE::Slice{prefix.data(), prefix.size()});
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    auto decoded =
        encoder.try_decode<T>(detail::to_bytes_view(iterator->value()));
    if (!decoded) {
      spdlog::warn("Failed decoding record for key '{}'", key_view);
    } else {
      visit(std::move(decoded.value()));
    }
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB scan failed: {}", iterator->status().ToString());
    mnemo::common::critical("RocksDB scan failed");
  }
}

inline void store<rocksdb_store_tag>::save_memory(
    const mnemo::schema::memory_object_t& memory) {
  put(detail::make_key(detail::kPrimaryPrefix, memory.memory_id), memory);
}

inline std::optional<mnemo::schema::memory_object_t>
store<rocksdb_store_tag>::get_memory(
    const mnemo::schema::memory_id_t& memory_id) const {
  return get<mnemo::schema::memory_object_t>(
      detail::make_key(detail::kPrimaryPrefix, memory_id));
}

inline void store<rocksdb_store_tag>::update_memory(
    const mnemo::schema::memory_object_t& memory) {
  put(detail::make_key(detail::kPrimaryPrefix, memory.memory_id), memory);
}

inline void store<rocksdb_store_tag>::remove_memory(
    const mnemo::schema::memory_id_t& memory_id) {
  erase(detail::make_key(detail::kPrimaryPrefix, memory_id));
}

inline std::vector<mnemo::schema::memory_object_t>
store<rocksdb_store_tag>::list_memories(
    const mnemo::schema::namespace_id_t& ns,
    const mnemo::schema::list_memory_options_t& options,
    const mnemo::schema::timestamp_milliseconds_t now) const {
  auto memories = std::vector<mnemo::schema::memory_object_t>{};
  scan<mnemo::schema::memory_object_t>(
      detail::kPrimaryPrefix, [&](mnemo::schema::memory_object_t&& memory) {
        if (memory.ns == ns && matches_list_options(memory, options, now)) {
          memories.push_back(std::move(memory));
        }
      });
  page(memories, options.order, options.offset, options.limit);
  return memories;
}

inline void store<rocksdb_store_tag>::save_quarantined(
    const mnemo::schema::memory_object_t& memory) {
  put(detail::make_key(detail::kQuarantinePrefix, memory.memory_id), memory);
}

inline std::optional<mnemo::schema::memory_object_t>
store<rocksdb_store_tag>::get_quarantined(
    const mnemo::schema::memory_id_t& memory_id) const {
  return get<mnemo::schema::memory_object_t>(
      detail::make_key(detail::kQuarantinePrefix, memory_id));
}

inline std::vector<mnemo::schema::memory_object_t>
store<rocksdb_store_tag>::list_quarantined(
    const mnemo::schema::namespace_id_t& ns,
    const mnemo::schema::list_options_t& options) const {
  auto memories = std::vector<mnemo::schema::memory_object_t>{};
  scan<mnemo::schema::memory_object_t>(
      detail::kQuarantinePrefix, [&](mnemo::schema::memory_object_t&& memory) {
        if (memory.ns == ns) {
          memories.push_back(std::move(memory));
        }
      });
  page(memories, options.order, options.offset, options.limit);
  return memories;
}

inline void store<rocksdb_store_tag>::delete_quarantined(
    const mnemo::schema::memory_id_t& memory_id) {
  erase(detail::make_key(detail::kQuarantinePrefix, memory_id));
}

inline std::vector<mnemo::schema::memory_result_t>
store<rocksdb_store_tag>::search_memories(
    const mnemo::schema::memory_query_t& query,
    const mnemo::schema::timestamp_milliseconds_t now) const {
  auto candidates = std::vector<mnemo::schema::memory_object_t>{};
  scan<mnemo::schema::memory_object_t>(
      detail::kPrimaryPrefix, [&](mnemo::schema::memory_object_t&& memory) {
        if (matches_query(memory, query, now)) {
          candidates.push_back(std::move(memory));
        }
      });
  return mnemo::ranking::rank_memories(candidates, query, now);
}

inline bool store<rocksdb_store_tag>::log_audit(
    const mnemo::schema::audit_entry_t& entry) {
  if (!database) {
    return false;
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(entry);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::make_audit_key(entry),
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!status.ok()) {
    spdlog::warn("Failed to write audit entry {}: {}", entry.id,
                 status.ToString());
    return false;
  }
  return true;
}

inline std::vector<mnemo::schema::audit_entry_t>
store<rocksdb_store_tag>::get_audit_log(
    const mnemo::schema::namespace_id_t& ns,
    const mnemo::schema::list_options_t& options) const {
  auto entries = std::vector<mnemo::schema::audit_entry_t>{};
  scan<mnemo::schema::audit_entry_t>(
      detail::make_audit_prefix(ns),
      [&](mnemo::schema::audit_entry_t&& entry) {
        entries.push_back(std::move(entry));
      });
  page(entries, options);
  return entries;
}

inline std::vector<mnemo::schema::provenance_entry_t>
store<rocksdb_store_tag>::get_memory_audit_log(
    const mnemo::schema::memory_id_t& memory_id) const {
  if (auto memory = get_memory(memory_id)) {
    return memory->provenance;
  }
  if (auto memory = get_quarantined(memory_id)) {
    return memory->provenance;
  }
  return {};
}

}  // namespace mnemo::storage
