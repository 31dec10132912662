#pragma once

#include <mnemo/schema/primitives.hpp>
#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <string>

// Schema type: memory source.
// Origin descriptor of a memory: who or what produced it, and when.
namespace mnemo::schema {

template <uint16_t Version>
struct memory_source;

template <>
struct memory_source<1> final {
  uint16_t version{1};
  source_type_t type{source_type_t::user_input};
  std::string identifier;
  std::string timestamp;
  attribute_list_t metadata;
};

using memory_source_t = memory_source<1>;

}  // namespace mnemo::schema
