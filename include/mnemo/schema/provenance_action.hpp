#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: provenance action.
// One lifecycle action recorded in a memory's provenance.
namespace mnemo::schema {

enum class provenance_action_t : uint8_t {
  created = 0,
  accessed = 1,
  modified = 2,
  cited = 3,
  invalidated = 4,
  edited = 5,
  deleted = 6,
  merged = 7,
  quarantined = 8,
  rolled_back = 9,
  expired = 10
};

inline constexpr auto kProvenanceActionMappings = std::array{
    std::pair<std::string_view, provenance_action_t>{"created", provenance_action_t::created},
    std::pair<std::string_view, provenance_action_t>{"accessed", provenance_action_t::accessed},
    std::pair<std::string_view, provenance_action_t>{"modified", provenance_action_t::modified},
    std::pair<std::string_view, provenance_action_t>{"cited", provenance_action_t::cited},
    std::pair<std::string_view, provenance_action_t>{"invalidated", provenance_action_t::invalidated},
    std::pair<std::string_view, provenance_action_t>{"edited", provenance_action_t::edited},
    std::pair<std::string_view, provenance_action_t>{"deleted", provenance_action_t::deleted},
    std::pair<std::string_view, provenance_action_t>{"merged", provenance_action_t::merged},
    std::pair<std::string_view, provenance_action_t>{"quarantined", provenance_action_t::quarantined},
    std::pair<std::string_view, provenance_action_t>{"rolled_back", provenance_action_t::rolled_back},
    std::pair<std::string_view, provenance_action_t>{"expired", provenance_action_t::expired}};

template <>
inline std::optional<provenance_action_t> try_from_string<provenance_action_t>(
    const std::string_view value) {
  return from_string(value, kProvenanceActionMappings);
}

inline constexpr std::string_view to_string(const provenance_action_t value) {
  return to_string(value, kProvenanceActionMappings).value_or("unknown");
}

}  // namespace mnemo::schema
