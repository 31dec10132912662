#pragma once

#include <mnemo/schema/content_format.hpp>
#include <mnemo/schema/source_type.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: validation result.
// Verdict of the ingestion validator. Rejected input carries a reason and
// no normalized content; accepted input may still be quarantined.
namespace mnemo::schema {

template <uint16_t Version>
struct validation_result;

template <>
struct validation_result<1> final {
  bool accepted{};
  bool quarantined{};
  source_type_t source_type{source_type_t::user_input};
  std::string source_id;
  std::string normalized_content;
  std::string normalized_content_type{"text"};
  content_format_t detected_format{content_format_t::text};
  double confidence_score{};
  std::vector<std::string> anomaly_flags;
  std::vector<std::string> validation_notes;
  std::optional<std::string> rejection_reason;
};

using validation_result_t = validation_result<1>;

}  // namespace mnemo::schema
