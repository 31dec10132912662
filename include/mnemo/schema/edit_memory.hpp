#pragma once

#include <mnemo/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: edit memory.
// Partial update; absent fields are left unchanged, tags are replaced whole.
namespace mnemo::schema {

template <uint16_t Version>
struct edit_memory;

template <>
struct edit_memory<1> final {
  std::optional<std::string> content;
  std::optional<std::string> content_type;
  std::optional<tag_list_t> tags;
  std::optional<double> importance;
  std::optional<double> task_criticality;
  std::optional<embedding_t> embedding;
};

using edit_memory_t = edit_memory<1>;

}  // namespace mnemo::schema
