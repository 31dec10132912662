#pragma once
#include <mnemo/schema/audit_entry.hpp>
#include <mnemo/schema/list_options.hpp>
#include <mnemo/schema/memory_object.hpp>
#include <mnemo/schema/memory_query.hpp>
#include <mnemo/schema/primitives.hpp>
#include <vector>

// Scan helpers shared by every store backend.
namespace mnemo::storage {

/// TTL of zero, a passed expires_at, or created_at + ttl_seconds reached.
bool is_expired(const mnemo::schema::memory_object_t& memory,
                mnemo::schema::timestamp_milliseconds_t now);

bool matches_list_options(const mnemo::schema::memory_object_t& memory,
                          const mnemo::schema::list_memory_options_t& options,
                          mnemo::schema::timestamp_milliseconds_t now);

/// Structural search filters: active status, tags (AND), source types,
/// minimum importance, session scope and expiry.
bool matches_query(const mnemo::schema::memory_object_t& memory,
                   const mnemo::schema::memory_query_t& query,
                   mnemo::schema::timestamp_milliseconds_t now);

/// Order by created_at, then apply offset and limit.
void page(std::vector<mnemo::schema::memory_object_t>& memories,
          mnemo::schema::list_order_t order,
          uint64_t offset,
          const std::optional<uint64_t>& limit);

void page(std::vector<mnemo::schema::audit_entry_t>& entries,
          const mnemo::schema::list_options_t& options);

}  // namespace mnemo::storage
