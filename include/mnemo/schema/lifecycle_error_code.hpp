#pragma once

#include <cstdint>

// Schema type: lifecycle error code.
// Stable numeric codes for rejected lifecycle operations.
namespace mnemo::schema {

enum class lifecycle_error_code : uint32_t {
  not_found = 1,
  already_in_state = 2,
  invalid_transition = 3,
  validation_rejected = 4,
  version_not_found = 5,
  namespace_mismatch = 6,
  insufficient_sources = 7,
};

}  // namespace mnemo::schema
