#pragma once

#include <mnemo/schema/list_order.hpp>
#include <mnemo/schema/memory_status.hpp>
#include <cstdint>
#include <optional>

// Schema type: list options.
// Paging and filtering for namespace scans.
namespace mnemo::schema {

template <uint16_t Version>
struct list_options;

template <>
struct list_options<1> final {
  std::optional<uint64_t> limit;
  uint64_t offset{};
  list_order_t order{list_order_t::desc};
};

using list_options_t = list_options<1>;

template <uint16_t Version>
struct list_memory_options;

template <>
struct list_memory_options<1> final {
  std::optional<uint64_t> limit;
  uint64_t offset{};
  list_order_t order{list_order_t::desc};
  /// When absent every status except deleted is listed.
  std::optional<memory_status_t> status;
  bool include_expired{};
};

using list_memory_options_t = list_memory_options<1>;

}  // namespace mnemo::schema
