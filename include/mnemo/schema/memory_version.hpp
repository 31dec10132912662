#pragma once

#include <mnemo/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: memory version.
// Snapshot of the editable fields captured before a mutation, used for
// rollback.
namespace mnemo::schema {

template <uint16_t Version>
struct memory_version;

template <>
struct memory_version<1> final {
  uint64_t version{};
  std::string content;
  std::string content_type;
  tag_list_t tags;
  double importance{};
  double task_criticality{};
  std::string superseded_at;
  std::string superseded_by;
  std::optional<std::string> change_reason;
};

using memory_version_t = memory_version<1>;

}  // namespace mnemo::schema
