#pragma once

#include <mnemo/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: list order.
// Sort direction on created_at for list operations.
namespace mnemo::schema {

enum class list_order_t : uint8_t {
  asc = 0,
  desc = 1
};

inline constexpr auto kListOrderMappings = std::array{
    std::pair<std::string_view, list_order_t>{"asc", list_order_t::asc},
    std::pair<std::string_view, list_order_t>{"desc", list_order_t::desc}};

template <>
inline std::optional<list_order_t> try_from_string<list_order_t>(
    const std::string_view value) {
  return from_string(value, kListOrderMappings);
}

inline constexpr std::string_view to_string(const list_order_t value) {
  return to_string(value, kListOrderMappings).value_or("unknown");
}

}  // namespace mnemo::schema
