#pragma once

#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: create memory.
// Caller input for a new memory. The source timestamp is assigned on create.
namespace mnemo::schema {

template <uint16_t Version>
struct create_memory;

template <>
struct create_memory<1> final {
  namespace_id_t ns;
  std::string content;
  std::optional<std::string> content_type;
  source_type_t source_type{source_type_t::user_input};
  std::string source_identifier;
  attribute_list_t source_metadata;
  tag_list_t tags;
  std::optional<double> importance;
  std::optional<double> task_criticality;
  std::optional<embedding_t> embedding;
  std::optional<uint64_t> ttl_seconds;
  std::optional<std::string> session_id;
};

using create_memory_t = create_memory<1>;

}  // namespace mnemo::schema
