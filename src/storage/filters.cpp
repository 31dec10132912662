#include <mnemo/storage/filters.hpp>

#include <algorithm>
#include <iterator>

using namespace mnemo::schema;

namespace mnemo::storage {

namespace {

template <typename T, typename Key>
void order_and_slice(std::vector<T>& items,
                     const list_order_t order,
                     const uint64_t offset,
                     const std::optional<uint64_t>& limit,
                     Key key) {
  std::stable_sort(std::begin(items), std::end(items),
                   [&](const auto& lhs, const auto& rhs) {
                     return order == list_order_t::asc ? key(lhs) < key(rhs)
                                                       : key(rhs) < key(lhs);
                   });
  if (offset >= items.size()) {
    items.clear();
    return;
  }
  items.erase(std::begin(items),
              std::next(std::begin(items), static_cast<std::ptrdiff_t>(offset)));
  if (limit && *limit < items.size()) {
    items.resize(*limit);
  }
}

}  // namespace

bool is_expired(const memory_object_t& memory,
                const timestamp_milliseconds_t now) {
  if (memory.expires_at) {
    auto expires_at = try_parse_timestamp(*memory.expires_at);
    if (expires_at && *expires_at <= now) {
      return true;
    }
  }
  if (!memory.ttl_seconds) {
    return false;
  }
  if (*memory.ttl_seconds == 0) {
    return true;
  }
  auto created = try_parse_timestamp(memory.created_at);
  if (!created) {
    return false;
  }
  if (now < *created) {
    return false;
  }
  // Compare in seconds; ttl_seconds * 1000 overflows for very long TTLs.
  auto age_seconds =
      static_cast<uint64_t>(now - *created) /
      static_cast<uint64_t>(kMillisecondsPerSecond);
  return age_seconds >= *memory.ttl_seconds;
}

bool matches_list_options(const memory_object_t& memory,
                          const list_memory_options_t& options,
                          const timestamp_milliseconds_t now) {
  if (options.status) {
    if (memory.status != *options.status) {
      return false;
    }
  } else if (memory.status == memory_status_t::deleted) {
    return false;
  }
  if (!options.include_expired && is_expired(memory, now)) {
    return false;
  }
  return true;
}

bool matches_query(const memory_object_t& memory,
                   const memory_query_t& query,
                   const timestamp_milliseconds_t now) {
  if (memory.status != memory_status_t::active) {
    return false;
  }
  if (!(memory.ns == query.ns)) {
    return false;
  }
  for (const auto& tag : query.tags) {
    if (std::find(std::begin(memory.tags), std::end(memory.tags), tag) ==
        std::end(memory.tags)) {
      return false;
    }
  }
  if (!query.source_types.empty() &&
      std::find(std::begin(query.source_types), std::end(query.source_types),
                memory.source.type) == std::end(query.source_types)) {
    return false;
  }
  if (query.min_importance && memory.importance < *query.min_importance) {
    return false;
  }
  if (query.session_id && !query.include_cross_session &&
      memory.session_id != query.session_id) {
    return false;
  }
  return !is_expired(memory, now);
}

void page(std::vector<memory_object_t>& memories,
          const list_order_t order,
          const uint64_t offset,
          const std::optional<uint64_t>& limit) {
  order_and_slice(memories, order, offset, limit, [](const auto& memory) {
    return try_parse_timestamp(memory.created_at).value_or(0);
  });
}

void page(std::vector<audit_entry_t>& entries, const list_options_t& options) {
  order_and_slice(entries, options.order, options.offset, options.limit,
                  [](const auto& entry) {
                    return try_parse_timestamp(entry.timestamp).value_or(0);
                  });
}

}  // namespace mnemo::storage
