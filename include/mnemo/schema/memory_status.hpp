#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: memory status.
// Lifecycle state; deleted is terminal.
namespace mnemo::schema {

enum class memory_status_t : uint8_t {
  active = 0,
  quarantined = 1,
  deleted = 2
};

inline constexpr auto kMemoryStatusMappings = std::array{
    std::pair<std::string_view, memory_status_t>{"active", memory_status_t::active},
    std::pair<std::string_view, memory_status_t>{"quarantined", memory_status_t::quarantined},
    std::pair<std::string_view, memory_status_t>{"deleted", memory_status_t::deleted}};

template <>
inline std::optional<memory_status_t> try_from_string<memory_status_t>(
    const std::string_view value) {
  return from_string(value, kMemoryStatusMappings);
}

inline constexpr std::string_view to_string(const memory_status_t value) {
  return to_string(value, kMemoryStatusMappings).value_or("unknown");
}

}  // namespace mnemo::schema
