#pragma once

#include <cstddef>
#include <cstdint>

// Schema type: validation config.
namespace mnemo::schema {

template <uint16_t Version>
struct validation_config;

template <>
struct validation_config<1> final {
  std::size_t max_entry_length{16000};
  double quarantine_threshold{0.45};
};

using validation_config_t = validation_config<1>;

}  // namespace mnemo::schema
