#pragma once

#include <mnemo/schema/memory_object.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: lifecycle results.
// Envelopes returned by lifecycle operations; code 0 means success.
namespace mnemo::schema {

template <uint16_t Version>
struct lifecycle_result;

template <>
struct lifecycle_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<memory_object_t> memory;
};

using lifecycle_result_t = lifecycle_result<1>;

template <uint16_t Version>
struct merge_result;

template <>
struct merge_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::optional<memory_object_t> merged_memory;
  std::vector<memory_id_t> merged_ids;
};

using merge_result_t = merge_result<1>;

template <uint16_t Version>
struct expire_result;

template <>
struct expire_result<1> final {
  uint16_t version{1};
  uint64_t expired_count{};
  std::vector<memory_id_t> expired_ids;
};

using expire_result_t = expire_result<1>;

}  // namespace mnemo::schema
