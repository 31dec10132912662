#pragma once

#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: validation input.
// Raw content handed to the ingestion validator before a memory is built.
namespace mnemo::schema {

template <uint16_t Version>
struct validation_input;

template <>
struct validation_input<1> final {
  std::string content;
  source_type_t source_type{source_type_t::user_input};
  std::string source_id;
  std::optional<std::string> declared_content_type;
};

using validation_input_t = validation_input<1>;

}  // namespace mnemo::schema
