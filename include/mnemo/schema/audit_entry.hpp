#pragma once

#include <mnemo/schema/audit_action.hpp>
#include <mnemo/schema/namespace_id.hpp>
#include <mnemo/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: audit entry.
// Namespace-level access and mutation log row, written best-effort.
namespace mnemo::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  std::string id;
  namespace_id_t ns;
  audit_action_t action{audit_action_t::read};
  std::string resource_type{"memory"};
  std::string resource_id;
  std::string actor_id;
  std::string timestamp;
  attribute_list_t metadata;
};

using audit_entry_t = audit_entry<1>;

}  // namespace mnemo::schema
