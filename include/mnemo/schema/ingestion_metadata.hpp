#pragma once

#include <mnemo/schema/content_format.hpp>
#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: ingestion metadata.
// Trust verdict captured once at creation by the validation collaborator.
namespace mnemo::schema {

template <uint16_t Version>
struct ingestion_metadata;

template <>
struct ingestion_metadata<1> final {
  uint16_t version{1};
  source_type_t source_type{source_type_t::user_input};
  std::string source_id;
  std::string ingestion_timestamp;
  double confidence_score{};
  content_format_t detected_format{content_format_t::text};
  std::vector<std::string> anomaly_flags;
  bool quarantined{};
  std::vector<std::string> validation_notes;
};

using ingestion_metadata_t = ingestion_metadata<1>;

}  // namespace mnemo::schema
