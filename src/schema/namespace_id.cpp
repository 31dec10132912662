#include <mnemo/schema/namespace_id.hpp>

namespace mnemo::schema {

std::string make_namespace_key(const namespace_id_t& ns) {
  auto key = std::string{};
  key.reserve(ns.org_id.size() + ns.app_id.size() + ns.agent_id.size() + 3 +
              ns.user_id.value_or("").size());
  key.append(ns.org_id).append(":").append(ns.app_id).append(":").append(
      ns.agent_id);
  if (ns.user_id.has_value() && !ns.user_id->empty()) {
    key.append(":").append(*ns.user_id);
  }
  return key;
}

}  // namespace mnemo::schema
