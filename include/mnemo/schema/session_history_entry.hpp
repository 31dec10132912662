#pragma once

#include <mnemo/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: session history entry.
// Memories of one originating session, with cross-session recall totals.
namespace mnemo::schema {

template <uint16_t Version>
struct session_history_entry;

template <>
struct session_history_entry<1> final {
  std::string session_id;
  std::string namespace_key;
  std::string started_at;
  std::optional<std::string> ended_at;
  std::vector<memory_id_t> memory_ids;
  uint64_t memory_count{};
  std::optional<std::string> parent_session_id;
  uint64_t cross_session_recalls{};
};

using session_history_entry_t = session_history_entry<1>;

}  // namespace mnemo::schema
