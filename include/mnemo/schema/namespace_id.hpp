#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: namespace identifier.
// Partition key scoping every memory, audit and session operation.
namespace mnemo::schema {

template <uint16_t Version>
struct namespace_id;

template <>
struct namespace_id<1> final {
  uint16_t version{1};
  std::string org_id;
  std::string app_id;
  std::string agent_id;
  std::optional<std::string> user_id;

  bool operator==(const namespace_id<1>&) const = default;
};

using namespace_id_t = namespace_id<1>;

/// Deterministic `org:app:agent[:user]` key. An empty user id is treated as
/// absent.
std::string make_namespace_key(const namespace_id_t& ns);

}  // namespace mnemo::schema
