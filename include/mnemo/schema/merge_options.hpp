#pragma once

#include <mnemo/schema/primitives.hpp>
#include <cstdint>
#include <optional>

// Schema type: merge options.
// Overrides for the combined attributes; defaults are tag union and mean
// importance and task criticality.
namespace mnemo::schema {

template <uint16_t Version>
struct merge_options;

template <>
struct merge_options<1> final {
  std::optional<tag_list_t> tags;
  std::optional<double> importance;
  std::optional<double> task_criticality;
};

using merge_options_t = merge_options<1>;

}  // namespace mnemo::schema
