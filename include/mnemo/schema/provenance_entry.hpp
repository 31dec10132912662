#pragma once

#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/provenance_action.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: provenance entry.
// Immutable audit record of one lifecycle action taken on a memory.
namespace mnemo::schema {

template <uint16_t Version>
struct provenance_entry;

template <>
struct provenance_entry<1> final {
  provenance_action_t action{provenance_action_t::created};
  std::string actor_id;
  std::optional<std::string> checkpoint_id;
  std::string timestamp;
  std::optional<std::string> reason;
  /// Memory version after an edit or rollback.
  std::optional<uint64_t> version;
  std::vector<memory_id_t> merged_from;
  std::optional<std::string> previous_content;
};

using provenance_entry_t = provenance_entry<1>;

}  // namespace mnemo::schema
